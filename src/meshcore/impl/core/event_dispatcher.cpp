#include "core/event_dispatcher.h"
#include "utils/log.h"

#include <algorithm>
#include <chrono>

namespace meshcore {

namespace {
const char* const STOP_TOPIC = "__meshcore.dispatcher.stop__";
}

EventDispatcher::EventDispatcher(size_t threadPoolSize, size_t queueCapacity)
    : subscriptions_()
    , subscriptionsMutex_()
    , nextId_(1)
    , threadPool_(std::make_unique<utils::ThreadPool>(threadPoolSize, "bus"))
    , eventQueue_(queueCapacity)
    , running_(false)
    , inFlight_(0)
    , dispatchThread_() {
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    dispatchThread_ = std::thread(&EventDispatcher::dispatchLoop, this);
    LOGD("EventDispatcher started");
}

void EventDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the dispatch thread even if the queue is full
    if (!eventQueue_.tryPush(Event(STOP_TOPIC))) {
        eventQueue_.close();
    }

    if (dispatchThread_.joinable()) {
        dispatchThread_.join();
    }

    threadPool_->shutdown();
    threadPool_->wait();
    LOGD("EventDispatcher stopped");
}

bool EventDispatcher::publish(const Event& event) {
    if (!running_) {
        LOGW_FMT("Dropping event on stopped bus: " << event.getTopic());
        return false;
    }

    ++inFlight_;
    if (!eventQueue_.tryPush(event)) {
        --inFlight_;
        LOGE_FMT("Event queue full, dropping event: " << event.getTopic());
        return false;
    }
    return true;
}

SubscriptionId EventDispatcher::subscribe(const std::string& pattern,
                                          std::shared_ptr<IEventListener> listener,
                                          bool synchronous) {
    if (!listener) {
        throw std::invalid_argument("Cannot subscribe a null listener to '" + pattern + "'");
    }

    SubscriptionId id = nextId_++;
    std::unique_lock<std::shared_mutex> lock(subscriptionsMutex_);
    subscriptions_.push_back(Subscription{id, pattern, std::move(listener), synchronous});
    LOGD_FMT("Subscription " << id << " added for pattern '" << pattern << "'");
    return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
    std::unique_lock<std::shared_mutex> lock(subscriptionsMutex_);
    auto it = std::remove_if(subscriptions_.begin(), subscriptions_.end(),
        [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it, subscriptions_.end());
    return true;
}

void EventDispatcher::publishSync(const Event& event) {
    for (const auto& subscription : getMatchingSubscriptions(event)) {
        deliver(subscription, event);
    }
}

size_t EventDispatcher::getSubscriptionCount() const {
    std::shared_lock<std::shared_mutex> lock(subscriptionsMutex_);
    return subscriptions_.size();
}

size_t EventDispatcher::getPendingEventCount() const {
    return eventQueue_.size();
}

bool EventDispatcher::waitForEvents(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();

    // inFlight_ covers queued events until their fan-out is done
    while (inFlight_ > 0 || threadPool_->getOutstandingTaskCount() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        if (timeout_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed.count() >= timeout_ms) {
                return false;
            }
        }
    }
    return true;
}

void EventDispatcher::dispatchLoop() {
    while (true) {
        auto eventOpt = eventQueue_.pop(std::chrono::milliseconds(100));

        if (!eventOpt.has_value()) {
            if (!running_ || eventQueue_.isClosed()) {
                break;
            }
            continue;
        }

        Event event = std::move(eventOpt.value());
        if (event.getTopic() == STOP_TOPIC) {
            break;
        }

        for (const auto& subscription : getMatchingSubscriptions(event)) {
            if (subscription.synchronous) {
                deliver(subscription, event);
                continue;
            }
            try {
                threadPool_->enqueue([this, subscription, event]() {
                    deliver(subscription, event);
                });
            } catch (const std::runtime_error& e) {
                LOGW_FMT("Delivery of " << event.getTopic() << " skipped: " << e.what());
            }
        }
        --inFlight_;
    }
}

void EventDispatcher::deliver(const Subscription& subscription, const Event& event) {
    try {
        subscription.listener->handleEvent(event);
    } catch (const std::exception& e) {
        LOGE_FMT("Listener for '" << subscription.pattern << "' failed on "
                 << event.getTopic() << ": " << e.what());
    }
}

std::vector<EventDispatcher::Subscription>
EventDispatcher::getMatchingSubscriptions(const Event& event) const {
    std::shared_lock<std::shared_mutex> lock(subscriptionsMutex_);

    std::vector<Subscription> matching;
    matching.reserve(subscriptions_.size());
    for (const auto& subscription : subscriptions_) {
        if (event.matchesTopic(subscription.pattern)) {
            matching.push_back(subscription);
        }
    }
    return matching;
}

} // namespace meshcore
