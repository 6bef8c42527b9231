#ifndef MESHCORE_ROUTING_ROUTER_H
#define MESHCORE_ROUTING_ROUTER_H

#include "config/mesh_config.h"
#include "routing/load_balancer.h"
#include "routing/service_mapping_resolver.h"
#include "store/endpoint_store.h"
#include "utils/clock.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Result of a route lookup
 */
struct Route {
    std::string appId;
    Endpoint primary;
    std::vector<Endpoint> alternates;
    LoadBalancingAlgorithm algorithm = LoadBalancingAlgorithm::ROUND_ROBIN;
};

/**
 * @brief Chooses an endpoint for an appId
 *
 * Candidates are the non-expired Healthy or Degraded endpoints of the appId
 * (optionally restricted to those serving a service name). Two filters are
 * then applied in order, each ignored when it would leave nothing:
 * 1. liveness: heartbeat no older than the degradation threshold
 * 2. load: loadPercent not above the load threshold
 *
 * The load balancing algorithm picks the primary among the survivors; up to
 * max_top_endpoints_returned other survivors are returned as alternates.
 */
class Router {
public:
    /**
     * @param state Load balancing state; a private one is created if null
     */
    Router(const RegistryConfig& config,
           EndpointStorePtr store,
           ServiceMappingResolverPtr mappings,
           LoadBalancingStatePtr state = nullptr,
           utils::ClockPtr clock = utils::systemClock());

    /**
     * @throws MeshException NOT_FOUND if no candidate exists
     * @throws MeshException DEPENDENCY_UNAVAILABLE if the store is unreachable
     */
    Route resolve(const std::string& appId,
                  const std::optional<std::string>& serviceName = std::nullopt,
                  std::optional<LoadBalancingAlgorithm> algorithm = std::nullopt);

    /**
     * @brief Map a service name to its appId, then resolve that appId
     */
    Route resolveService(const std::string& serviceName,
                         std::optional<LoadBalancingAlgorithm> algorithm = std::nullopt);

    const LoadBalancingStatePtr& getLoadBalancingState() const;

    const ServiceMappingResolverPtr& getMappings() const { return mappings_; }

private:
    std::vector<Endpoint> loadCandidates(const std::string& appId,
                                         const std::optional<std::string>& serviceName);

    RegistryConfig config_;
    EndpointStorePtr store_;
    ServiceMappingResolverPtr mappings_;
    LoadBalancer balancer_;
    utils::ClockPtr clock_;
};

using RouterPtr = std::shared_ptr<Router>;

} // namespace meshcore

#endif // MESHCORE_ROUTING_ROUTER_H
