#include "store/circuit_breaker_store.h"
#include "utils/log.h"

#include <stdexcept>

namespace meshcore {

nlohmann::json toJson(const CircuitRecord& record) {
    nlohmann::json json;
    json["state"] = to_string(record.state);
    json["consecutiveFailures"] = record.consecutiveFailures;
    if (record.openedAt) {
        json["openedAt"] = utils::toEpochMillis(*record.openedAt);
    } else {
        json["openedAt"] = nullptr;
    }
    return json;
}

CircuitRecord circuitRecordFromJson(const nlohmann::json& json) {
    CircuitRecord record;
    record.state = circuitStateFromString(json.value("state", std::string("Closed")));
    record.consecutiveFailures = json.value("consecutiveFailures", 0u);
    if (json.contains("openedAt") && json["openedAt"].is_number()) {
        record.openedAt = utils::fromEpochMillis(json["openedAt"].get<int64_t>());
    }
    return record;
}

CircuitBreakerStore::CircuitBreakerStore(StateStorePtr store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("CircuitBreakerStore requires a state store");
    }
}

std::string CircuitBreakerStore::circuitKey(const std::string& appId) {
    return CIRCUIT_KEY_PREFIX + appId;
}

CircuitRecord CircuitBreakerStore::parse(const std::string& appId,
                                         const std::optional<std::string>& value) {
    if (!value) {
        return CircuitRecord();
    }
    try {
        return circuitRecordFromJson(nlohmann::json::parse(*value));
    } catch (const nlohmann::json::exception& e) {
        LOGE_FMT("Malformed circuit record for " << appId << ", treating as Closed: " << e.what());
        return CircuitRecord();
    }
}

CircuitRecord CircuitBreakerStore::get(const std::string& appId) {
    return parse(appId, store_->get(circuitKey(appId)));
}

CircuitUpdate CircuitBreakerStore::update(const std::string& appId, const Mutator& mutator) {
    CircuitUpdate result;

    store_->atomicUpdate(circuitKey(appId),
        [&](const std::optional<std::string>& current) -> std::optional<std::string> {
            result.before = parse(appId, current);
            result.after = mutator(result.before);
            if (current && result.after == result.before) {
                return std::nullopt;
            }
            return toJson(result.after).dump();
        });

    return result;
}

} // namespace meshcore
