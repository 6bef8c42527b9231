#ifndef MESHCORE_REGISTRY_REGISTRY_SERVICE_H
#define MESHCORE_REGISTRY_REGISTRY_SERVICE_H

#include "config/mesh_config.h"
#include "core/message_bus.h"
#include "registry/endpoint.h"
#include "store/endpoint_store.h"
#include "utils/clock.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshcore {

struct RegisterRequest {
    std::string appId;
    std::string host;
    int port = 0;
    std::set<std::string> serviceNames;
    std::optional<std::string> instanceId;
    std::optional<int> maxConnections;
};

/**
 * @brief Liveness report for one endpoint
 *
 * appId, serviceNames and maxConnections are only used when the instance is
 * unknown and gets registered by this heartbeat.
 */
struct HeartbeatRequest {
    std::string instanceId;
    EndpointStatus status = EndpointStatus::HEALTHY;
    double loadPercent = 0.0;
    int currentConnections = 0;
    std::optional<std::vector<std::string>> issues;
    std::optional<std::string> appId;
    std::optional<std::set<std::string>> serviceNames;
    std::optional<int> maxConnections;
};

struct HeartbeatResponse {
    std::chrono::seconds nextHeartbeat{0};
    std::chrono::seconds ttl{0};
    bool registered = false;
};

struct EndpointsResult {
    std::vector<Endpoint> endpoints;
    size_t healthyCount = 0;
    size_t totalCount = 0;
};

struct EndpointSummary {
    size_t total = 0;
    size_t healthy = 0;
    size_t degraded = 0;
    size_t unavailable = 0;
    size_t shuttingDown = 0;
    size_t uniqueAppIds = 0;
    std::map<std::string, size_t> healthyByAppId;
};

struct EndpointListing {
    std::vector<Endpoint> endpoints;
    EndpointSummary summary;
};

/**
 * @brief Endpoint registry on top of the EndpointStore
 *
 * Statuses reported to callers are effective statuses: a stored Healthy
 * endpoint whose heartbeat is older than the degradation threshold reads as
 * Degraded. Store failures surface as MeshException DEPENDENCY_UNAVAILABLE;
 * nothing is retried here.
 *
 * Lifecycle events are published on the bus when one is given:
 * - mesh.endpoint.registered
 * - mesh.endpoint.deregistered
 * - mesh.endpoint.degraded (Healthy to Degraded on a heartbeat, deduplicated)
 */
class RegistryService {
public:
    RegistryService(const RegistryConfig& config,
                    EndpointStorePtr store,
                    MessageBusPtr bus = nullptr,
                    const std::string& origin = "registry",
                    utils::ClockPtr clock = utils::systemClock());

    /**
     * @brief Register (or re-register) an endpoint
     * @return The instance ID, generated when the request has none
     * @throws MeshException INVALID_ARGUMENT on a missing appId, host or bad port
     */
    std::string registerEndpoint(const RegisterRequest& request);

    /**
     * @throws MeshException NOT_FOUND if the instance is not registered
     */
    void deregisterEndpoint(const std::string& instanceId, DeregistrationReason reason);

    /**
     * @brief Refresh an endpoint's TTL and mutable fields
     *
     * An unknown instance is registered when the request carries an appId,
     * otherwise NOT_FOUND is thrown. Issues are overwritten verbatim; an
     * absent list clears them.
     */
    HeartbeatResponse heartbeat(const HeartbeatRequest& request);

    /**
     * @brief Heartbeat received as a bus signal
     *
     * Same as heartbeat() except that an absent issue list keeps the
     * previous issues.
     */
    HeartbeatResponse handleHeartbeatSignal(const HeartbeatRequest& request);

    EndpointsResult getEndpoints(const std::string& appId,
                                 const std::optional<std::string>& serviceName = std::nullopt,
                                 bool healthyOnly = true);

    EndpointListing listEndpoints(const std::string& appIdPrefix = "",
                                  std::optional<EndpointStatus> statusFilter = std::nullopt);

    /**
     * @throws MeshException NOT_FOUND if the instance is not registered
     */
    Endpoint getEndpoint(const std::string& instanceId);

    bool isStoreHealthy();

    /**
     * @brief Time of the last successful registry write
     */
    std::optional<utils::TimePoint> getLastUpdateTime() const;

    const RegistryConfig& getConfig() const { return config_; }

    const EndpointStorePtr& getStore() const { return store_; }

    static EndpointSummary summarize(const std::vector<Endpoint>& endpoints);

private:
    HeartbeatResponse applyHeartbeat(const HeartbeatRequest& request, bool keepIssuesWhenAbsent);
    Endpoint withEffectiveStatus(Endpoint endpoint, utils::TimePoint now) const;
    DegradationReason degradationReason(const Endpoint& endpoint) const;
    void maybePublishDegraded(const Endpoint& endpoint, EndpointStatus previous);
    void publishRegistered(const Endpoint& endpoint);
    void publish(const Event& event);
    void touch();

    RegistryConfig config_;
    EndpointStorePtr store_;
    MessageBusPtr bus_;
    std::string origin_;
    utils::ClockPtr clock_;

    mutable std::mutex mutex_;
    std::optional<utils::TimePoint> lastUpdate_;
    std::map<std::string, utils::TimePoint> degradedPublished_;
};

using RegistryServicePtr = std::shared_ptr<RegistryService>;

} // namespace meshcore

#endif // MESHCORE_REGISTRY_REGISTRY_SERVICE_H
