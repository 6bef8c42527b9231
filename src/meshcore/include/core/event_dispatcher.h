#ifndef MESHCORE_CORE_EVENT_DISPATCHER_H
#define MESHCORE_CORE_EVENT_DISPATCHER_H

#include "core/message_bus.h"
#include "utils/blocking_queue.h"
#include "utils/thread_pool.h"

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace meshcore {

/**
 * @brief In-process IMessageBus
 *
 * Published events are queued and fanned out by a dispatch thread to the
 * matching subscriptions: synchronous subscriptions run on the dispatch
 * thread, the rest on a worker pool. Several MeshService instances sharing
 * one dispatcher behave like separate processes attached to one broker.
 *
 * A listener that throws is logged and does not affect other listeners.
 */
class EventDispatcher : public IMessageBus {
public:
    /**
     * @param threadPoolSize Worker threads for asynchronous delivery
     * @param queueCapacity Maximum pending events (0 = unlimited)
     */
    explicit EventDispatcher(size_t threadPoolSize = 4, size_t queueCapacity = 10000);

    ~EventDispatcher() override;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();

    /**
     * @brief Stop dispatching; pending deliveries on workers complete
     */
    void stop();

    bool isRunning() const { return running_; }

    bool publish(const Event& event) override;

    SubscriptionId subscribe(const std::string& pattern,
                             std::shared_ptr<IEventListener> listener,
                             bool synchronous = false) override;

    bool unsubscribe(SubscriptionId id) override;

    /**
     * @brief Deliver on the calling thread, bypassing the queue
     */
    void publishSync(const Event& event);

    size_t getSubscriptionCount() const;

    size_t getPendingEventCount() const;

    /**
     * @brief Wait until the queue is drained and no delivery is running
     *
     * @param timeout_ms Maximum time to wait (0 = wait forever)
     * @return true if idle, false on timeout
     */
    bool waitForEvents(int timeout_ms = 0);

private:
    struct Subscription {
        SubscriptionId id;
        std::string pattern;
        std::shared_ptr<IEventListener> listener;
        bool synchronous;
    };

    void dispatchLoop();

    void deliver(const Subscription& subscription, const Event& event);

    std::vector<Subscription> getMatchingSubscriptions(const Event& event) const;

    std::vector<Subscription> subscriptions_;
    mutable std::shared_mutex subscriptionsMutex_;
    std::atomic<SubscriptionId> nextId_;
    std::unique_ptr<utils::ThreadPool> threadPool_;
    utils::BlockingQueue<Event> eventQueue_;
    std::atomic<bool> running_;
    std::atomic<size_t> inFlight_;
    std::thread dispatchThread_;
};

} // namespace meshcore

#endif // MESHCORE_CORE_EVENT_DISPATCHER_H
