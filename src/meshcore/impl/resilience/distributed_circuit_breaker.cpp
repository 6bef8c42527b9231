#include "resilience/distributed_circuit_breaker.h"
#include "core/event_listener.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <mutex>
#include <stdexcept>
#include <unordered_map>

namespace meshcore {

/**
 * @brief Private implementation class for DistributedCircuitBreaker
 */
class DistributedCircuitBreaker::Impl {
public:
    Impl(const CircuitBreakerConfig& config,
         CircuitBreakerStorePtr store,
         MessageBusPtr bus,
         const std::string& origin,
         utils::ClockPtr clock)
        : config_(config)
        , store_(std::move(store))
        , bus_(std::move(bus))
        , origin_(origin)
        , clock_(clock ? std::move(clock) : utils::systemClock())
        , subscription_(0)
        , subscribed_(false) {
        if (!store_) {
            throw std::invalid_argument("DistributedCircuitBreaker requires a circuit breaker store");
        }
        validateConfig();
        LOGI_FMT("Creating DistributedCircuitBreaker - enabled: " << config_.enabled
                 << ", failure_threshold: " << config_.failure_threshold
                 << ", open_timeout: " << config_.open_timeout.count() << "ms"
                 << ", origin: " << origin_);
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (subscribed_ || !bus_) {
            return;
        }
        auto listener = std::make_shared<FunctionEventListener>(
            [this](const Event& event) { handleBroadcast(event); });
        subscription_ = bus_->subscribe(STATE_TOPIC, listener, true);
        subscribed_ = true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!subscribed_) {
            return;
        }
        if (!bus_->unsubscribe(subscription_)) {
            LOGW_FMT("Circuit broadcast subscription " << subscription_ << " was already gone");
        }
        subscribed_ = false;
    }

    bool isCallAllowed(const std::string& appId) {
        if (!config_.enabled) {
            return true;
        }
        return effectiveState(lookup(appId)) != CircuitState::OPEN;
    }

    void recordSuccess(const std::string& appId) {
        if (!config_.enabled) {
            return;
        }
        apply(appId, [this](const CircuitRecord& current) {
            CircuitRecord next = current;
            next.consecutiveFailures = 0;
            if (effectiveState(current) == CircuitState::HALF_OPEN) {
                next.state = CircuitState::CLOSED;
                next.openedAt.reset();
            }
            return next;
        });
    }

    void recordFailure(const std::string& appId) {
        if (!config_.enabled) {
            return;
        }
        apply(appId, [this](const CircuitRecord& current) {
            CircuitRecord next = current;
            next.consecutiveFailures = current.consecutiveFailures + 1;

            switch (effectiveState(current)) {
                case CircuitState::CLOSED:
                    if (next.consecutiveFailures >= config_.failure_threshold) {
                        next.state = CircuitState::OPEN;
                        next.openedAt = clock_->now();
                    }
                    break;

                case CircuitState::HALF_OPEN:
                    // A failed probe re-opens the circuit for a full window
                    next.state = CircuitState::OPEN;
                    next.openedAt = clock_->now();
                    break;

                case CircuitState::OPEN:
                    break;
            }
            return next;
        });
    }

    CircuitState getState(const std::string& appId) {
        if (!config_.enabled) {
            return CircuitState::CLOSED;
        }
        return effectiveState(lookup(appId));
    }

    CircuitRecord getRecord(const std::string& appId) {
        return lookup(appId);
    }

    void clearCache() {
        std::lock_guard<std::mutex> lock(mirror_mutex_);
        mirror_.clear();
    }

    bool isEnabled() const {
        return config_.enabled;
    }

    CircuitBreakerConfig getConfig() const {
        return config_;
    }

    const std::string& getOrigin() const {
        return origin_;
    }

    void setStateChangeCallback(StateChangeCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        state_change_callback_ = std::move(callback);
    }

private:
    void validateConfig() {
        if (config_.failure_threshold == 0) {
            throw std::invalid_argument("Failure threshold must be > 0");
        }
        if (config_.open_timeout.count() <= 0) {
            throw std::invalid_argument("Open timeout must be > 0");
        }
    }

    CircuitState effectiveState(const CircuitRecord& record) const {
        if (record.state == CircuitState::OPEN && record.openedAt &&
            clock_->now() - *record.openedAt >= config_.open_timeout) {
            return CircuitState::HALF_OPEN;
        }
        return record.state;
    }

    CircuitRecord lookup(const std::string& appId) {
        {
            std::lock_guard<std::mutex> lock(mirror_mutex_);
            auto it = mirror_.find(appId);
            if (it != mirror_.end()) {
                return it->second;
            }
        }

        CircuitRecord record;
        try {
            record = store_->get(appId);
        } catch (const MeshException& e) {
            LOGW_FMT("Circuit state for " << appId << " unavailable, assuming Closed: " << e.what());
            return record;
        }

        std::lock_guard<std::mutex> lock(mirror_mutex_);
        mirror_.emplace(appId, record);
        return record;
    }

    void apply(const std::string& appId, const CircuitBreakerStore::Mutator& mutator) {
        // Mirror writes must follow the order of the store updates
        std::unique_lock<std::mutex> updateLock(update_mutex_);

        CircuitUpdate update;
        try {
            update = store_->update(appId, mutator);
        } catch (const MeshException& e) {
            // Keep deciding locally until the store is back
            LOGW_FMT("Circuit store unavailable for " << appId << ", updating local state only: " << e.what());
            update.before = lookup(appId);
            update.after = mutator(update.before);
        }

        {
            std::lock_guard<std::mutex> lock(mirror_mutex_);
            mirror_[appId] = update.after;
        }
        updateLock.unlock();

        CircuitState oldState = effectiveState(update.before);
        CircuitState newState = update.after.state;
        if (oldState != newState) {
            transitionTo(appId, oldState, update.after);
        }
    }

    void transitionTo(const std::string& appId, CircuitState oldState, const CircuitRecord& record) {
        LOGI_FMT("Circuit breaker state transition for " << appId << ": "
                 << to_string(oldState) << " -> " << to_string(record.state)
                 << " (consecutive failures: " << record.consecutiveFailures << ")");

        broadcast(appId, oldState, record);

        StateChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = state_change_callback_;
        }
        if (callback) {
            try {
                callback(appId, oldState, record.state);
            } catch (const std::exception& e) {
                LOGE_FMT("Exception in circuit state change callback: " << e.what());
            }
        }
    }

    void broadcast(const std::string& appId, CircuitState oldState, const CircuitRecord& record) {
        if (!bus_) {
            return;
        }

        Event event(STATE_TOPIC, origin_);
        event.setProperty("appId", appId);
        event.setProperty("previousState", std::string(to_string(oldState)));
        event.setProperty("newState", std::string(to_string(record.state)));
        event.setProperty("consecutiveFailures", static_cast<int>(record.consecutiveFailures));
        if (record.openedAt) {
            event.setProperty("openedAt", utils::toEpochMillis(*record.openedAt));
        }

        if (!bus_->publish(event)) {
            LOGW_FMT("Circuit state broadcast for " << appId << " was not queued");
        }
    }

    void handleBroadcast(const Event& event) {
        if (event.getOrigin() == origin_) {
            return;
        }

        std::string appId = event.getPropertyString("appId");
        if (appId.empty()) {
            LOGW_FMT("Ignoring circuit broadcast without appId from " << event.getOrigin());
            return;
        }

        const Properties& props = event.getProperties();
        CircuitRecord record;
        record.state = circuitStateFromString(props.getString("newState"));
        record.consecutiveFailures = static_cast<uint32_t>(props.getInt("consecutiveFailures"));
        if (props.has("openedAt")) {
            record.openedAt = utils::fromEpochMillis(props.getInt64("openedAt"));
        } else if (record.state == CircuitState::OPEN) {
            record.openedAt = clock_->now();
        }

        LOGD_FMT("Circuit broadcast from " << event.getOrigin() << ": " << appId
                 << " -> " << to_string(record.state));

        std::lock_guard<std::mutex> lock(mirror_mutex_);
        mirror_[appId] = record;
    }

    CircuitBreakerConfig config_;
    CircuitBreakerStorePtr store_;
    MessageBusPtr bus_;
    std::string origin_;
    utils::ClockPtr clock_;

    std::mutex mirror_mutex_;
    std::mutex update_mutex_;
    std::unordered_map<std::string, CircuitRecord> mirror_;

    std::mutex lifecycle_mutex_;
    SubscriptionId subscription_;
    bool subscribed_;

    std::mutex callback_mutex_;
    StateChangeCallback state_change_callback_;
};

// DistributedCircuitBreaker public interface implementation
DistributedCircuitBreaker::DistributedCircuitBreaker(const CircuitBreakerConfig& config,
                                                     CircuitBreakerStorePtr store,
                                                     MessageBusPtr bus,
                                                     const std::string& origin,
                                                     utils::ClockPtr clock)
    : pImpl_(std::make_unique<Impl>(config, std::move(store), std::move(bus), origin, std::move(clock))) {
}

DistributedCircuitBreaker::~DistributedCircuitBreaker() = default;

void DistributedCircuitBreaker::start() {
    pImpl_->start();
}

void DistributedCircuitBreaker::stop() {
    pImpl_->stop();
}

bool DistributedCircuitBreaker::isCallAllowed(const std::string& appId) {
    return pImpl_->isCallAllowed(appId);
}

void DistributedCircuitBreaker::recordSuccess(const std::string& appId) {
    pImpl_->recordSuccess(appId);
}

void DistributedCircuitBreaker::recordFailure(const std::string& appId) {
    pImpl_->recordFailure(appId);
}

CircuitState DistributedCircuitBreaker::getState(const std::string& appId) {
    return pImpl_->getState(appId);
}

CircuitRecord DistributedCircuitBreaker::getRecord(const std::string& appId) {
    return pImpl_->getRecord(appId);
}

void DistributedCircuitBreaker::clearCache() {
    pImpl_->clearCache();
}

bool DistributedCircuitBreaker::isEnabled() const {
    return pImpl_->isEnabled();
}

CircuitBreakerConfig DistributedCircuitBreaker::getConfig() const {
    return pImpl_->getConfig();
}

const std::string& DistributedCircuitBreaker::getOrigin() const {
    return pImpl_->getOrigin();
}

void DistributedCircuitBreaker::setStateChangeCallback(StateChangeCallback callback) {
    pImpl_->setStateChangeCallback(std::move(callback));
}

// DistributedCircuitBreakerBuilder implementation
DistributedCircuitBreakerBuilder::DistributedCircuitBreakerBuilder()
    : config_()
    , store_()
    , bus_()
    , origin_("local")
    , clock_(utils::systemClock()) {
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withConfig(const CircuitBreakerConfig& config) {
    config_ = config;
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::enabled(bool value) {
    config_.enabled = value;
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withFailureThreshold(uint32_t threshold) {
    config_.failure_threshold = threshold;
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withResetTimeout(
    std::chrono::milliseconds timeout) {
    config_.open_timeout = timeout;
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withStore(CircuitBreakerStorePtr store) {
    store_ = std::move(store);
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withMessageBus(MessageBusPtr bus) {
    bus_ = std::move(bus);
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withOrigin(const std::string& origin) {
    origin_ = origin;
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::withClock(utils::ClockPtr clock) {
    clock_ = std::move(clock);
    return *this;
}

DistributedCircuitBreakerBuilder& DistributedCircuitBreakerBuilder::onStateChange(
    DistributedCircuitBreaker::StateChangeCallback callback) {
    state_change_callback_ = std::move(callback);
    return *this;
}

std::unique_ptr<DistributedCircuitBreaker> DistributedCircuitBreakerBuilder::build() {
    auto breaker = std::make_unique<DistributedCircuitBreaker>(config_, store_, bus_, origin_, clock_);

    if (state_change_callback_) {
        breaker->setStateChangeCallback(state_change_callback_);
    }

    return breaker;
}

} // namespace meshcore
