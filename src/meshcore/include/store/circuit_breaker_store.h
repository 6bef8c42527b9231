#ifndef MESHCORE_STORE_CIRCUIT_BREAKER_STORE_H
#define MESHCORE_STORE_CIRCUIT_BREAKER_STORE_H

#include "resilience/reliability_types.h"
#include "store/state_store.h"
#include "utils/clock.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace meshcore {

/**
 * @brief Persisted breaker state of one appId
 */
struct CircuitRecord {
    CircuitState state = CircuitState::CLOSED;
    uint32_t consecutiveFailures = 0;
    std::optional<utils::TimePoint> openedAt;

    bool operator==(const CircuitRecord& other) const {
        return state == other.state &&
               consecutiveFailures == other.consecutiveFailures &&
               openedAt == other.openedAt;
    }

    bool operator!=(const CircuitRecord& other) const {
        return !(*this == other);
    }
};

nlohmann::json toJson(const CircuitRecord& record);

CircuitRecord circuitRecordFromJson(const nlohmann::json& json);

/**
 * @brief Before and after images of one atomic breaker update
 */
struct CircuitUpdate {
    CircuitRecord before;
    CircuitRecord after;

    bool stateChanged() const { return before.state != after.state; }
};

/**
 * @brief Per-appId breaker records at "mesh:circuit:{appId}"
 *
 * Records are only mutated through IStateStore::atomicUpdate, so
 * concurrent failure reports for one appId never lose an increment.
 */
class CircuitBreakerStore {
public:
    static constexpr const char* CIRCUIT_KEY_PREFIX = "mesh:circuit:";

    using Mutator = std::function<CircuitRecord(const CircuitRecord& current)>;

    explicit CircuitBreakerStore(StateStorePtr store);

    /**
     * @return The stored record, or a Closed record if none exists
     */
    CircuitRecord get(const std::string& appId);

    /**
     * @brief Apply @p mutator atomically; an unchanged result is not written
     */
    CircuitUpdate update(const std::string& appId, const Mutator& mutator);

    static std::string circuitKey(const std::string& appId);

private:
    static CircuitRecord parse(const std::string& appId, const std::optional<std::string>& value);

    StateStorePtr store_;
};

using CircuitBreakerStorePtr = std::shared_ptr<CircuitBreakerStore>;

} // namespace meshcore

#endif // MESHCORE_STORE_CIRCUIT_BREAKER_STORE_H
