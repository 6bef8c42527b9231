#ifndef MESHCORE_RESILIENCE_RETRY_POLICY_H
#define MESHCORE_RESILIENCE_RETRY_POLICY_H

#include "resilience/reliability_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace meshcore {

/**
 * @brief Exponential backoff and transient-failure classification
 *
 * Delay before retry N (1-based) is
 * initial_delay * backoff_multiplier^(N-1), capped at max_delay. With the
 * defaults that is 100ms, 200ms, 400ms.
 *
 * Waiting goes through a replaceable sleep function so tests can observe
 * the delays without sleeping.
 */
class RetryPolicy {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    /**
     * @brief Called before each wait with the retry number and its delay
     */
    using DelayCallback = std::function<void(uint32_t attempt, std::chrono::milliseconds delay)>;

    /**
     * @throws std::invalid_argument on a negative delay or a multiplier below 1
     */
    explicit RetryPolicy(const RetryConfig& config = RetryConfig());

    /**
     * @brief Delay before retry @p attempt_number (1-based)
     */
    std::chrono::milliseconds calculateDelay(uint32_t attempt_number) const;

    /**
     * @return true if retry @p attempt_number (1-based) is within max_retries
     */
    bool shouldRetry(uint32_t attempt_number) const;

    /**
     * @brief Wait before retry @p attempt_number
     */
    void backoff(uint32_t attempt_number);

    /**
     * @brief HTTP statuses worth retrying: 408, 429, 500, 502, 503, 504
     */
    static bool isTransientStatus(int http_status);

    const RetryConfig& getConfig() const { return config_; }

    void setSleepFunction(SleepFunction sleeper);

    void setDelayCallback(DelayCallback callback);

private:
    RetryConfig config_;

    mutable std::mutex callback_mutex_;
    SleepFunction sleeper_;
    DelayCallback delay_callback_;
};

} // namespace meshcore

#endif // MESHCORE_RESILIENCE_RETRY_POLICY_H
