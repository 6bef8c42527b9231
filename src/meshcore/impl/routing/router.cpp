#include "routing/router.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <stdexcept>

namespace meshcore {

namespace {

/**
 * @brief Keep the endpoints matching @p pred unless none do
 */
template<typename Pred>
std::vector<Endpoint> filterOrKeep(const std::vector<Endpoint>& input, Pred pred, const char* name) {
    std::vector<Endpoint> output;
    for (const auto& endpoint : input) {
        if (pred(endpoint)) {
            output.push_back(endpoint);
        }
    }
    if (output.empty()) {
        LOGD_FMT("Ignoring " << name << " filter, it would leave no endpoints");
        return input;
    }
    return output;
}

} // anonymous namespace

Router::Router(const RegistryConfig& config,
               EndpointStorePtr store,
               ServiceMappingResolverPtr mappings,
               LoadBalancingStatePtr state,
               utils::ClockPtr clock)
    : config_(config)
    , store_(std::move(store))
    , mappings_(mappings ? std::move(mappings)
                         : std::make_shared<ServiceMappingResolver>(config.default_app_id))
    , balancer_(state ? std::move(state)
                      : std::make_shared<LoadBalancingState>(config.load_balancing_state_max_app_ids))
    , clock_(clock ? std::move(clock) : utils::systemClock()) {
    if (!store_) {
        throw std::invalid_argument("Router requires an endpoint store");
    }
}

std::vector<Endpoint> Router::loadCandidates(const std::string& appId,
                                             const std::optional<std::string>& serviceName) {
    std::vector<Endpoint> candidates;
    for (auto& endpoint : store_->getEndpointsForApp(appId)) {
        if (endpoint.status != EndpointStatus::HEALTHY && endpoint.status != EndpointStatus::DEGRADED) {
            continue;
        }
        if (serviceName && !serviceName->empty() && !endpoint.servesService(*serviceName)) {
            continue;
        }
        candidates.push_back(std::move(endpoint));
    }
    return candidates;
}

Route Router::resolve(const std::string& appId,
                      const std::optional<std::string>& serviceName,
                      std::optional<LoadBalancingAlgorithm> algorithm) {
    if (appId.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "appId must not be empty");
    }

    std::vector<Endpoint> candidates = loadCandidates(appId, serviceName);
    if (candidates.empty()) {
        std::string what = "no routable endpoints for appId " + appId;
        if (serviceName && !serviceName->empty()) {
            what += " serving " + *serviceName;
        }
        LOGW_FMT("Route lookup failed: " << what);
        throw MeshException(MeshErrorCode::NOT_FOUND, what);
    }

    auto now = clock_->now();
    auto threshold = config_.degradation_threshold;
    std::vector<Endpoint> survivors = filterOrKeep(candidates,
        [&](const Endpoint& e) { return e.heartbeatAge(now) <= threshold; }, "liveness");

    double loadLimit = config_.load_threshold_percent;
    survivors = filterOrKeep(survivors,
        [&](const Endpoint& e) { return e.loadPercent <= loadLimit; }, "load");

    Route route;
    route.appId = appId;
    route.algorithm = algorithm ? *algorithm : config_.default_load_balancer;

    size_t selected = balancer_.select(route.algorithm, appId, survivors);
    route.primary = survivors[selected];

    for (size_t i = 0; i < survivors.size() && route.alternates.size() < config_.max_top_endpoints_returned; ++i) {
        if (i != selected) {
            route.alternates.push_back(survivors[i]);
        }
    }

    LOGD_FMT("Routed " << appId << " to " << route.primary.instanceId << " ("
             << route.primary.host << ":" << route.primary.port << ") via "
             << to_string(route.algorithm) << ", " << route.alternates.size() << " alternates");
    return route;
}

Route Router::resolveService(const std::string& serviceName,
                             std::optional<LoadBalancingAlgorithm> algorithm) {
    if (serviceName.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "service name must not be empty");
    }
    std::string appId = mappings_->resolve(serviceName);
    return resolve(appId, std::nullopt, algorithm);
}

const LoadBalancingStatePtr& Router::getLoadBalancingState() const {
    return balancer_.getState();
}

} // namespace meshcore
