#include "resilience/retry_policy.h"
#include "utils/log.h"

#include <cmath>
#include <stdexcept>
#include <thread>

namespace meshcore {

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (config_.initial_delay.count() < 0) {
        throw std::invalid_argument("Initial retry delay must not be negative");
    }
    if (config_.backoff_multiplier < 1.0) {
        throw std::invalid_argument("Backoff multiplier must be >= 1.0");
    }
}

std::chrono::milliseconds RetryPolicy::calculateDelay(uint32_t attempt_number) const {
    if (attempt_number == 0) {
        return std::chrono::milliseconds(0);
    }

    double factor = std::pow(config_.backoff_multiplier, static_cast<double>(attempt_number - 1));
    double delay_ms = static_cast<double>(config_.initial_delay.count()) * factor;

    if (config_.max_delay.count() > 0 && delay_ms > static_cast<double>(config_.max_delay.count())) {
        return config_.max_delay;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

bool RetryPolicy::shouldRetry(uint32_t attempt_number) const {
    return attempt_number >= 1 && attempt_number <= config_.max_retries;
}

void RetryPolicy::backoff(uint32_t attempt_number) {
    auto delay = calculateDelay(attempt_number);
    LOGD_FMT("RetryPolicy: retry " << attempt_number << " after " << delay.count() << "ms delay");

    SleepFunction sleeper;
    DelayCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        sleeper = sleeper_;
        callback = delay_callback_;
    }

    if (callback) {
        callback(attempt_number, delay);
    }
    if (sleeper && delay.count() > 0) {
        sleeper(delay);
    }
}

bool RetryPolicy::isTransientStatus(int http_status) {
    switch (http_status) {
        case 408:
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

void RetryPolicy::setSleepFunction(SleepFunction sleeper) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    sleeper_ = std::move(sleeper);
}

void RetryPolicy::setDelayCallback(DelayCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    delay_callback_ = std::move(callback);
}

} // namespace meshcore
