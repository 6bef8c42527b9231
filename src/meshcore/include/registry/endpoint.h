#ifndef MESHCORE_REGISTRY_ENDPOINT_H
#define MESHCORE_REGISTRY_ENDPOINT_H

#include "utils/clock.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Self-reported (or derived) health of an endpoint
 */
enum class EndpointStatus {
    HEALTHY,
    DEGRADED,
    UNAVAILABLE,
    SHUTTING_DOWN
};

/**
 * @brief Why an endpoint left the registry
 */
enum class DeregistrationReason {
    GRACEFUL,
    HEALTH_CHECK_FAILED,
    ERROR
};

/**
 * @brief Why an endpoint was reported as degraded
 */
enum class DegradationReason {
    MISSED_HEARTBEAT,
    HIGH_LOAD,
    HIGH_CONNECTION_COUNT
};

const char* to_string(EndpointStatus status);
const char* to_string(DeregistrationReason reason);
const char* to_string(DegradationReason reason);

/**
 * @brief Parse a status name from a liveness signal
 *
 * Accepts Healthy, Degraded, Unavailable and ShuttingDown (case-insensitive).
 * "Overloaded" maps to DEGRADED; anything else maps to HEALTHY.
 */
EndpointStatus endpointStatusFromString(const std::string& name);

/**
 * @brief Parse a status name for an explicit filter
 * @return false if the name is not one of the four status names
 */
bool tryParseEndpointStatus(const std::string& name, EndpointStatus& out);

DeregistrationReason deregistrationReasonFromString(const std::string& name);

/**
 * @brief A concrete running instance of a service
 */
struct Endpoint {
    std::string instanceId;
    std::string appId;
    std::set<std::string> serviceNames;
    std::string host;
    int port = 0;
    EndpointStatus status = EndpointStatus::HEALTHY;
    int maxConnections = 0;
    int currentConnections = 0;
    double loadPercent = 0.0;
    utils::TimePoint lastHeartbeatAt;
    std::vector<std::string> issues;
    utils::TimePoint registeredAt;

    bool servesService(const std::string& serviceName) const {
        return serviceNames.count(serviceName) > 0;
    }

    /**
     * @brief Status as seen by readers at @p now
     *
     * A stored HEALTHY status reads as DEGRADED once the last heartbeat is
     * older than @p degradationThreshold.
     */
    EndpointStatus effectiveStatus(utils::TimePoint now,
                                   std::chrono::seconds degradationThreshold) const;

    std::chrono::milliseconds heartbeatAge(utils::TimePoint now) const;
};

/**
 * @brief Persisted JSON form of an endpoint (timestamps as epoch millis)
 */
nlohmann::json toJson(const Endpoint& endpoint);

/**
 * @throws nlohmann::json::exception on a malformed record
 */
Endpoint endpointFromJson(const nlohmann::json& json);

/**
 * @brief Generate a random RFC 4122 version 4 instance ID
 * @throws std::runtime_error if the system random source fails
 */
std::string generateInstanceId();

} // namespace meshcore

#endif // MESHCORE_REGISTRY_ENDPOINT_H
