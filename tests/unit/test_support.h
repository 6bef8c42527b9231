/**
 * @file test_support.h
 * @brief Test doubles shared by the unit tests
 */

#ifndef MESHCORE_TESTS_TEST_SUPPORT_H
#define MESHCORE_TESTS_TEST_SUPPORT_H

#include "client/http_transport.h"
#include "core/message_bus.h"
#include "store/state_store.h"

#include <cerrno>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace meshcore {
namespace testing_support {

/**
 * @brief Message bus delivering on the publishing thread and recording every event
 */
class RecordingMessageBus : public IMessageBus {
public:
    bool publish(const Event& event) override {
        std::vector<std::shared_ptr<IEventListener>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
            for (const auto& sub : subscriptions_) {
                if (event.matchesTopic(sub.pattern)) {
                    targets.push_back(sub.listener);
                }
            }
        }
        for (const auto& listener : targets) {
            listener->handleEvent(event);
        }
        return true;
    }

    SubscriptionId subscribe(const std::string& pattern,
                             std::shared_ptr<IEventListener> listener,
                             bool /*synchronous*/ = false) override {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = nextId_++;
        subscriptions_.push_back({id, pattern, std::move(listener)});
        return id;
    }

    bool unsubscribe(SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
            if (it->id == id) {
                subscriptions_.erase(it);
                return true;
            }
        }
        return false;
    }

    std::vector<Event> eventsFor(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> matching;
        for (const auto& event : events_) {
            if (event.getTopic() == topic) {
                matching.push_back(event);
            }
        }
        return matching;
    }

    size_t subscriptionCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    struct Subscription {
        SubscriptionId id;
        std::string pattern;
        std::shared_ptr<IEventListener> listener;
    };

    mutable std::mutex mutex_;
    SubscriptionId nextId_ = 1;
    std::vector<Subscription> subscriptions_;
    std::vector<Event> events_;
};

/**
 * @brief Scripted HTTP transport
 *
 * Queued results are returned first, then the handler is consulted; with
 * neither, every request answers 200.
 */
class FakeHttpTransport : public IHttpTransport {
public:
    using Handler = std::function<TransportResult<HttpResponse>(const HttpRequest&)>;

    static TransportResult<HttpResponse> status(int code, const std::string& body = "") {
        TransportResult<HttpResponse> result;
        result.value.status = code;
        result.value.body = body;
        return result;
    }

    static TransportResult<HttpResponse> connectionError(int system_error = ECONNREFUSED) {
        TransportResult<HttpResponse> result;
        result.error = TransportError::CONNECTION_FAILED;
        result.system_error = system_error;
        result.error_message = "connection refused";
        return result;
    }

    TransportResult<HttpResponse> send(const HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (!queued_.empty()) {
                auto result = queued_.front();
                queued_.pop_front();
                return result;
            }
            handler = handler_;
        }
        if (handler) {
            return handler(request);
        }
        return status(200);
    }

    void enqueue(const TransportResult<HttpResponse>& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(result);
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<TransportResult<HttpResponse>> queued_;
    Handler handler_;
    std::vector<HttpRequest> requests_;
};

/**
 * @brief State store wrapper that runs a hook before selected operations
 *
 * Hooks inject failures (throw from them) or concurrent writes from
 * another process (mutate the inner store from them).
 */
class InterceptingStateStore : public IStateStore {
public:
    using Hook = std::function<void(const std::string& key)>;

    explicit InterceptingStateStore(StateStorePtr inner)
        : inner_(std::move(inner)) {
    }

    Hook beforeSetAdd;
    Hook beforeAtomicUpdate;

    std::optional<std::string> get(const std::string& key) override {
        return inner_->get(key);
    }

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override {
        inner_->set(key, value, ttl);
    }

    bool remove(const std::string& key) override {
        return inner_->remove(key);
    }

    bool expire(const std::string& key, std::chrono::milliseconds ttl) override {
        return inner_->expire(key, ttl);
    }

    bool setAdd(const std::string& key, const std::string& member) override {
        if (beforeSetAdd) {
            beforeSetAdd(key);
        }
        return inner_->setAdd(key, member);
    }

    bool setRemove(const std::string& key, const std::string& member) override {
        return inner_->setRemove(key, member);
    }

    std::vector<std::string> setMembers(const std::string& key) override {
        return inner_->setMembers(key);
    }

    std::optional<std::string> atomicUpdate(const std::string& key,
                                            const UpdateFunction& update) override {
        if (beforeAtomicUpdate) {
            beforeAtomicUpdate(key);
        }
        return inner_->atomicUpdate(key, update);
    }

    bool ping() override {
        return inner_->ping();
    }

private:
    StateStorePtr inner_;
};

} // namespace testing_support
} // namespace meshcore

#endif // MESHCORE_TESTS_TEST_SUPPORT_H
