#ifndef MESHCORE_CORE_MESSAGE_BUS_H
#define MESHCORE_CORE_MESSAGE_BUS_H

#include "core/event.h"
#include "core/event_listener.h"

#include <cstdint>
#include <memory>
#include <string>

namespace meshcore {

/**
 * @brief Handle returned by IMessageBus::subscribe
 */
using SubscriptionId = uint64_t;

/**
 * @brief Topic-based publish/subscribe channel shared by mesh processes
 *
 * Lifecycle events, inbound liveness and topology signals, and the circuit
 * state broadcast all travel over an IMessageBus. Every mesh process
 * attached to the same bus sees every published event, its own included.
 */
class IMessageBus {
public:
    virtual ~IMessageBus() = default;

    /**
     * @brief Publish an event for asynchronous delivery
     * @return false if the event could not be queued
     */
    virtual bool publish(const Event& event) = 0;

    /**
     * @brief Subscribe a listener to a topic pattern
     *
     * @param pattern Topic or trailing-wildcard pattern ("mesh.signal.*")
     * @param listener Shared ownership is kept until unsubscribe()
     * @param synchronous Deliver on the bus dispatch thread instead of a worker
     */
    virtual SubscriptionId subscribe(const std::string& pattern,
                                     std::shared_ptr<IEventListener> listener,
                                     bool synchronous = false) = 0;

    /**
     * @brief Remove a subscription
     * @return false if the id is unknown
     */
    virtual bool unsubscribe(SubscriptionId id) = 0;
};

using MessageBusPtr = std::shared_ptr<IMessageBus>;

} // namespace meshcore

#endif // MESHCORE_CORE_MESSAGE_BUS_H
