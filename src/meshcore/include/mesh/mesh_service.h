#ifndef MESHCORE_MESH_MESH_SERVICE_H
#define MESHCORE_MESH_MESH_SERVICE_H

#include "client/http_transport.h"
#include "client/invocation_client.h"
#include "config/mesh_config.h"
#include "core/message_bus.h"
#include "registry/registry_service.h"
#include "resilience/distributed_circuit_breaker.h"
#include "resilience/health_check_worker.h"
#include "routing/router.h"
#include "routing/service_mapping_resolver.h"
#include "store/state_store.h"
#include "utils/clock.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Result of getHealth()
 */
struct HealthReport {
    EndpointStatus status = EndpointStatus::HEALTHY;
    EndpointSummary summary;
    bool storeConnected = false;
    std::optional<utils::TimePoint> lastUpdateTime;
    std::chrono::seconds uptime{0};
    std::string uptimeText;
    std::vector<Endpoint> endpoints;
};

/**
 * @brief Mesh API facade
 *
 * Owns the registry, mapping table, router and circuit breaker built on a
 * shared state store, and ingests the inbound bus signals:
 * - mesh.signal.heartbeat: endpoint liveness, may register the endpoint
 * - mesh.signal.mappings: service mapping snapshots
 *
 * Signal handling errors are published on "mesh.error" and never rethrown.
 *
 * When a transport is given the service also owns an InvocationClient and
 * a HealthCheckWorker using it.
 */
class MeshService {
public:
    /**
     * @param origin Identifier of this process on the bus
     * @throws std::invalid_argument on an invalid config or a null store
     */
    MeshService(const MeshConfig& config,
                StateStorePtr store,
                MessageBusPtr bus,
                const std::string& origin,
                HttpTransportPtr transport = nullptr,
                utils::ClockPtr clock = utils::systemClock());

    ~MeshService();

    MeshService(const MeshService&) = delete;
    MeshService& operator=(const MeshService&) = delete;

    /**
     * @brief Subscribe to the inbound signals and start background work
     */
    void start();

    void stop();

    // ==================================================================
    // Registry
    // ==================================================================

    std::string registerEndpoint(const RegisterRequest& request);

    void deregisterEndpoint(const std::string& instanceId,
                            DeregistrationReason reason = DeregistrationReason::GRACEFUL);

    HeartbeatResponse heartbeat(const HeartbeatRequest& request);

    EndpointsResult getEndpoints(const std::string& appId,
                                 const std::optional<std::string>& serviceName = std::nullopt,
                                 bool healthyOnly = true);

    EndpointListing listEndpoints(const std::string& appIdPrefix = "",
                                  std::optional<EndpointStatus> statusFilter = std::nullopt);

    // ==================================================================
    // Routing
    // ==================================================================

    Route getRoute(const std::string& appId,
                   const std::optional<std::string>& serviceName = std::nullopt,
                   std::optional<LoadBalancingAlgorithm> algorithm = std::nullopt);

    Route getRouteForService(const std::string& serviceName,
                             std::optional<LoadBalancingAlgorithm> algorithm = std::nullopt);

    MappingSnapshot getMappings(const std::string& serviceNamePrefix = "") const;

    /**
     * @brief Overall mesh health
     *
     * Unavailable if the store does not answer or unavailable endpoints
     * outnumber healthy ones; Degraded if any endpoint is degraded or
     * unavailable; Healthy otherwise.
     */
    HealthReport getHealth(bool includeEndpoints = false);

    // ==================================================================
    // Inbound signals
    // ==================================================================

    void handleHeartbeatSignal(const Event& event);

    void handleMappingsSignal(const Event& event);

    // ==================================================================
    // Components
    // ==================================================================

    const MeshConfig& getConfig() const { return config_; }

    const std::string& getOrigin() const { return origin_; }

    const RegistryServicePtr& getRegistry() const { return registry_; }

    const RouterPtr& getRouter() const { return router_; }

    const ServiceMappingResolverPtr& getMappingResolver() const { return mappings_; }

    const std::shared_ptr<DistributedCircuitBreaker>& getCircuitBreaker() const { return breaker_; }

    /**
     * @return null unless a transport was given
     */
    const InvocationClientPtr& getInvocationClient() const { return invocation_; }

    HealthCheckWorker* getHealthCheckWorker() const { return health_worker_.get(); }

    /**
     * @brief "Xd Yh Zm", "Xh Ym" or "Xm Ys" depending on magnitude
     */
    static std::string formatUptime(std::chrono::seconds uptime);

private:
    void publishError(const std::string& operation, const std::exception& error);

    MeshConfig config_;
    MessageBusPtr bus_;
    std::string origin_;
    utils::ClockPtr clock_;
    utils::TimePoint started_at_;

    RegistryServicePtr registry_;
    ServiceMappingResolverPtr mappings_;
    RouterPtr router_;
    std::shared_ptr<DistributedCircuitBreaker> breaker_;
    InvocationClientPtr invocation_;
    std::unique_ptr<HealthCheckWorker> health_worker_;

    std::vector<SubscriptionId> subscriptions_;
    bool started_;
};

} // namespace meshcore

#endif // MESHCORE_MESH_MESH_SERVICE_H
