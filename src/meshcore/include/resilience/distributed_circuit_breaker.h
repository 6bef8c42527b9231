#ifndef MESHCORE_RESILIENCE_DISTRIBUTED_CIRCUIT_BREAKER_H
#define MESHCORE_RESILIENCE_DISTRIBUTED_CIRCUIT_BREAKER_H

#include "core/mesh_topics.h"
#include "core/message_bus.h"
#include "resilience/reliability_types.h"
#include "store/circuit_breaker_store.h"
#include "utils/clock.h"

#include <functional>
#include <memory>
#include <string>

namespace meshcore {

/**
 * @brief Per-appId circuit breaker shared by every mesh process
 *
 * The durable state of each appId lives in the CircuitBreakerStore and is
 * only changed through its atomic update. Each process keeps a local
 * mirror so that isCallAllowed() does not cost a store round trip:
 *
 * - CLOSED: calls allowed. recordFailure() reaching the threshold opens the
 *           circuit.
 *
 * - OPEN: calls fail fast until the reset window has elapsed since
 *         openedAt; after that the state reads as HALF_OPEN.
 *
 * - HALF_OPEN: calls go through as probes (concurrent probes are allowed).
 *              A success closes the circuit, a failure re-opens it with a
 *              fresh openedAt.
 *
 * Every transition is published on "mesh.circuit.state" with this
 * process's origin. Broadcasts from other processes update the mirror;
 * the process ignores its own.
 *
 * If the store is unreachable the breaker keeps working on the mirror
 * alone and calls are allowed when nothing is known about an appId.
 *
 * Example usage:
 * @code
 * auto breaker = DistributedCircuitBreakerBuilder()
 *     .withStore(circuitStore)
 *     .withMessageBus(bus)
 *     .withOrigin(processId)
 *     .withFailureThreshold(5)
 *     .withResetTimeout(std::chrono::seconds(30))
 *     .build();
 * breaker->start();
 *
 * if (breaker->isCallAllowed("auth")) {
 *     bool ok = call();
 *     ok ? breaker->recordSuccess("auth") : breaker->recordFailure("auth");
 * }
 * @endcode
 */
class DistributedCircuitBreaker {
public:
    static constexpr const char* STATE_TOPIC = topics::CIRCUIT_STATE;

    /**
     * @brief Callback type for local state transitions
     */
    using StateChangeCallback = std::function<void(const std::string& appId,
                                                   CircuitState old_state,
                                                   CircuitState new_state)>;

    /**
     * @param config Thresholds and enable flag
     * @param store Durable breaker records
     * @param bus Broadcast channel (may be null for a single process)
     * @param origin Identifier of this process on the broadcast channel
     * @param clock Time source for openedAt and the reset window
     * @throws std::invalid_argument on a null store or an invalid config
     */
    DistributedCircuitBreaker(const CircuitBreakerConfig& config,
                              CircuitBreakerStorePtr store,
                              MessageBusPtr bus,
                              const std::string& origin,
                              utils::ClockPtr clock = utils::systemClock());

    ~DistributedCircuitBreaker();

    DistributedCircuitBreaker(const DistributedCircuitBreaker&) = delete;
    DistributedCircuitBreaker& operator=(const DistributedCircuitBreaker&) = delete;

    /**
     * @brief Subscribe to state broadcasts from other processes
     */
    void start();

    void stop();

    /**
     * @brief false only while OPEN and the reset window has not elapsed
     */
    bool isCallAllowed(const std::string& appId);

    void recordSuccess(const std::string& appId);

    void recordFailure(const std::string& appId);

    /**
     * @brief Effective state (OPEN past its reset window reads HALF_OPEN)
     */
    CircuitState getState(const std::string& appId);

    /**
     * @brief Mirrored record for an appId, loading it from the store if needed
     */
    CircuitRecord getRecord(const std::string& appId);

    /**
     * @brief Drop the mirror so the next read goes to the store
     */
    void clearCache();

    bool isEnabled() const;

    CircuitBreakerConfig getConfig() const;

    const std::string& getOrigin() const;

    void setStateChangeCallback(StateChangeCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Builder for DistributedCircuitBreaker with fluent API
 */
class DistributedCircuitBreakerBuilder {
public:
    DistributedCircuitBreakerBuilder();

    DistributedCircuitBreakerBuilder& withConfig(const CircuitBreakerConfig& config);

    DistributedCircuitBreakerBuilder& enabled(bool value);

    DistributedCircuitBreakerBuilder& withFailureThreshold(uint32_t threshold);

    DistributedCircuitBreakerBuilder& withResetTimeout(std::chrono::milliseconds timeout);

    DistributedCircuitBreakerBuilder& withStore(CircuitBreakerStorePtr store);

    DistributedCircuitBreakerBuilder& withMessageBus(MessageBusPtr bus);

    DistributedCircuitBreakerBuilder& withOrigin(const std::string& origin);

    DistributedCircuitBreakerBuilder& withClock(utils::ClockPtr clock);

    DistributedCircuitBreakerBuilder& onStateChange(DistributedCircuitBreaker::StateChangeCallback callback);

    /**
     * @throws std::invalid_argument if no store was given
     */
    std::unique_ptr<DistributedCircuitBreaker> build();

private:
    CircuitBreakerConfig config_;
    CircuitBreakerStorePtr store_;
    MessageBusPtr bus_;
    std::string origin_;
    utils::ClockPtr clock_;
    DistributedCircuitBreaker::StateChangeCallback state_change_callback_;
};

} // namespace meshcore

#endif // MESHCORE_RESILIENCE_DISTRIBUTED_CIRCUIT_BREAKER_H
