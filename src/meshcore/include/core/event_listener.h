#ifndef MESHCORE_CORE_EVENT_LISTENER_H
#define MESHCORE_CORE_EVENT_LISTENER_H

#include "core/event.h"

#include <functional>

namespace meshcore {

/**
 * @brief Interface for message bus subscribers
 */
class IEventListener {
public:
    virtual ~IEventListener() = default;

    /**
     * @brief Handle an event
     *
     * @note Asynchronous subscriptions are invoked on bus worker threads.
     *       Implementations must be thread-safe.
     */
    virtual void handleEvent(const Event& event) = 0;
};

/**
 * @brief Adapter turning a callable into an IEventListener
 */
class FunctionEventListener : public IEventListener {
public:
    using Handler = std::function<void(const Event&)>;

    explicit FunctionEventListener(Handler handler)
        : handler_(std::move(handler)) {
    }

    void handleEvent(const Event& event) override {
        if (handler_) {
            handler_(event);
        }
    }

private:
    Handler handler_;
};

} // namespace meshcore

#endif // MESHCORE_CORE_EVENT_LISTENER_H
