#include "registry/endpoint.h"
#include "utils/string_utils.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdio>
#include <stdexcept>

namespace meshcore {

const char* to_string(EndpointStatus status) {
    switch (status) {
        case EndpointStatus::HEALTHY: return "Healthy";
        case EndpointStatus::DEGRADED: return "Degraded";
        case EndpointStatus::UNAVAILABLE: return "Unavailable";
        case EndpointStatus::SHUTTING_DOWN: return "ShuttingDown";
        default: return "Unknown";
    }
}

const char* to_string(DeregistrationReason reason) {
    switch (reason) {
        case DeregistrationReason::GRACEFUL: return "Graceful";
        case DeregistrationReason::HEALTH_CHECK_FAILED: return "HealthCheckFailed";
        case DeregistrationReason::ERROR: return "Error";
        default: return "Unknown";
    }
}

const char* to_string(DegradationReason reason) {
    switch (reason) {
        case DegradationReason::MISSED_HEARTBEAT: return "MissedHeartbeat";
        case DegradationReason::HIGH_LOAD: return "HighLoad";
        case DegradationReason::HIGH_CONNECTION_COUNT: return "HighConnectionCount";
        default: return "Unknown";
    }
}

bool tryParseEndpointStatus(const std::string& name, EndpointStatus& out) {
    std::string lower = utils::toLower(name);
    if (lower == "healthy") {
        out = EndpointStatus::HEALTHY;
    } else if (lower == "degraded") {
        out = EndpointStatus::DEGRADED;
    } else if (lower == "unavailable") {
        out = EndpointStatus::UNAVAILABLE;
    } else if (lower == "shuttingdown") {
        out = EndpointStatus::SHUTTING_DOWN;
    } else {
        return false;
    }
    return true;
}

EndpointStatus endpointStatusFromString(const std::string& name) {
    EndpointStatus status;
    if (tryParseEndpointStatus(name, status)) {
        return status;
    }
    if (utils::toLower(name) == "overloaded") {
        return EndpointStatus::DEGRADED;
    }
    return EndpointStatus::HEALTHY;
}

DeregistrationReason deregistrationReasonFromString(const std::string& name) {
    std::string lower = utils::toLower(name);
    if (lower == "healthcheckfailed") return DeregistrationReason::HEALTH_CHECK_FAILED;
    if (lower == "error") return DeregistrationReason::ERROR;
    return DeregistrationReason::GRACEFUL;
}

EndpointStatus Endpoint::effectiveStatus(utils::TimePoint now,
                                         std::chrono::seconds degradationThreshold) const {
    if (status == EndpointStatus::HEALTHY && heartbeatAge(now) > degradationThreshold) {
        return EndpointStatus::DEGRADED;
    }
    return status;
}

std::chrono::milliseconds Endpoint::heartbeatAge(utils::TimePoint now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - lastHeartbeatAt);
}

nlohmann::json toJson(const Endpoint& endpoint) {
    nlohmann::json json;
    json["instanceId"] = endpoint.instanceId;
    json["appId"] = endpoint.appId;
    json["serviceNames"] = endpoint.serviceNames;
    json["host"] = endpoint.host;
    json["port"] = endpoint.port;
    json["status"] = to_string(endpoint.status);
    json["maxConnections"] = endpoint.maxConnections;
    json["currentConnections"] = endpoint.currentConnections;
    json["loadPercent"] = endpoint.loadPercent;
    json["lastHeartbeatAt"] = utils::toEpochMillis(endpoint.lastHeartbeatAt);
    json["issues"] = endpoint.issues;
    json["registeredAt"] = utils::toEpochMillis(endpoint.registeredAt);
    return json;
}

Endpoint endpointFromJson(const nlohmann::json& json) {
    Endpoint endpoint;
    endpoint.instanceId = json.at("instanceId").get<std::string>();
    endpoint.appId = json.at("appId").get<std::string>();
    endpoint.serviceNames = json.value("serviceNames", std::set<std::string>());
    endpoint.host = json.at("host").get<std::string>();
    endpoint.port = json.at("port").get<int>();
    endpoint.status = endpointStatusFromString(json.value("status", std::string("Healthy")));
    endpoint.maxConnections = json.value("maxConnections", 0);
    endpoint.currentConnections = json.value("currentConnections", 0);
    endpoint.loadPercent = json.value("loadPercent", 0.0);
    endpoint.lastHeartbeatAt = utils::fromEpochMillis(json.value("lastHeartbeatAt", int64_t(0)));
    endpoint.issues = json.value("issues", std::vector<std::string>());
    endpoint.registeredAt = utils::fromEpochMillis(json.value("registeredAt", int64_t(0)));
    return endpoint;
}

std::string generateInstanceId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("Failed to generate instance ID: ") + err);
    }

    // version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buffer);
}

} // namespace meshcore
