#ifndef MESHCORE_RESILIENCE_RELIABILITY_TYPES_H
#define MESHCORE_RESILIENCE_RELIABILITY_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>

namespace meshcore {

/**
 * @brief Circuit breaker states following the state machine pattern
 */
enum class CircuitState {
    /**
     * @brief Normal operation, all calls allowed
     * Transitions to OPEN when consecutive failures reach the threshold
     */
    CLOSED,

    /**
     * @brief Calls to the appId fail fast without a network attempt
     * Reads as HALF_OPEN once the reset window has elapsed
     */
    OPEN,

    /**
     * @brief Probing whether the appId has recovered
     * Concurrent probes are allowed. A success closes the circuit, a
     * failure opens it again with a fresh openedAt.
     */
    HALF_OPEN
};

/**
 * @brief Configuration for the distributed circuit breaker
 */
struct CircuitBreakerConfig {
    /**
     * @brief Disabled breakers allow every call and ignore recorded outcomes
     */
    bool enabled = true;

    /**
     * @brief Number of consecutive failures before opening circuit
     */
    uint32_t failure_threshold = 5;

    /**
     * @brief Time to wait before letting probes through (OPEN -> HALF_OPEN)
     */
    std::chrono::milliseconds open_timeout{30000};
};

/**
 * @brief Configuration for invocation retry behavior
 */
struct RetryConfig {
    /**
     * @brief Maximum number of retry attempts (0 = no retries)
     */
    uint32_t max_retries = 3;

    /**
     * @brief Delay before the first retry attempt
     */
    std::chrono::milliseconds initial_delay{100};

    /**
     * @brief Cap for exponential growth
     */
    std::chrono::milliseconds max_delay{10000};

    /**
     * @brief Multiplier for exponential backoff (2.0 = double each time)
     */
    double backoff_multiplier = 2.0;
};

inline const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "Closed";
        case CircuitState::OPEN: return "Open";
        case CircuitState::HALF_OPEN: return "HalfOpen";
        default: return "Unknown";
    }
}

/**
 * @brief Parse a persisted or broadcast circuit state name
 * @return CLOSED for unrecognized names
 */
inline CircuitState circuitStateFromString(const std::string& name) {
    if (name == "Open") return CircuitState::OPEN;
    if (name == "HalfOpen") return CircuitState::HALF_OPEN;
    return CircuitState::CLOSED;
}

} // namespace meshcore

#endif // MESHCORE_RESILIENCE_RELIABILITY_TYPES_H
