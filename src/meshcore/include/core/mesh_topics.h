#ifndef MESHCORE_CORE_MESH_TOPICS_H
#define MESHCORE_CORE_MESH_TOPICS_H

namespace meshcore {
namespace topics {

// Outbound lifecycle events
constexpr const char* ENDPOINT_REGISTERED = "mesh.endpoint.registered";
constexpr const char* ENDPOINT_DEREGISTERED = "mesh.endpoint.deregistered";
constexpr const char* ENDPOINT_HEALTH_CHECK_FAILED = "mesh.endpoint.health-check-failed";
constexpr const char* ENDPOINT_DEGRADED = "mesh.endpoint.degraded";
constexpr const char* CIRCUIT_STATE = "mesh.circuit.state";
constexpr const char* ERROR = "mesh.error";

// Inbound signals
constexpr const char* HEARTBEAT_SIGNAL = "mesh.signal.heartbeat";
constexpr const char* MAPPINGS_SIGNAL = "mesh.signal.mappings";

} // namespace topics
} // namespace meshcore

#endif // MESHCORE_CORE_MESH_TOPICS_H
