#include "mesh/mesh_service.h"
#include "core/mesh_error.h"
#include "core/mesh_topics.h"
#include "store/circuit_breaker_store.h"
#include "store/endpoint_store.h"
#include "utils/log.h"

#include <sstream>
#include <stdexcept>

namespace meshcore {

MeshService::MeshService(const MeshConfig& config,
                         StateStorePtr store,
                         MessageBusPtr bus,
                         const std::string& origin,
                         HttpTransportPtr transport,
                         utils::ClockPtr clock)
    : config_(config)
    , bus_(std::move(bus))
    , origin_(origin)
    , clock_(clock ? std::move(clock) : utils::systemClock())
    , started_(false) {
    if (!store) {
        throw std::invalid_argument("MeshService requires a state store");
    }
    config_.validate();
    started_at_ = clock_->now();

    auto endpointStore = std::make_shared<EndpointStore>(store);
    registry_ = std::make_shared<RegistryService>(config_.registry, endpointStore, bus_, origin_, clock_);
    mappings_ = std::make_shared<ServiceMappingResolver>(config_.registry.default_app_id);
    router_ = std::make_shared<Router>(config_.registry, endpointStore, mappings_,
        std::make_shared<LoadBalancingState>(config_.registry.load_balancing_state_max_app_ids), clock_);

    breaker_ = DistributedCircuitBreakerBuilder()
        .withConfig(config_.circuit_breaker)
        .withStore(std::make_shared<CircuitBreakerStore>(store))
        .withMessageBus(bus_)
        .withOrigin(origin_)
        .withClock(clock_)
        .build();

    if (transport) {
        invocation_ = std::make_shared<InvocationClient>(config_.invocation, router_, transport, breaker_, clock_);
        health_worker_ = std::make_unique<HealthCheckWorker>(config_.health_check, registry_, transport, bus_, origin_);
    }

    LOGI_FMT("MeshService created (origin " << origin_ << ", default appId "
             << config_.registry.default_app_id << ")");
}

MeshService::~MeshService() {
    stop();
}

void MeshService::start() {
    if (started_) {
        LOGW_FMT("MeshService::start: already started");
        return;
    }

    breaker_->start();

    if (bus_) {
        subscriptions_.push_back(bus_->subscribe(topics::HEARTBEAT_SIGNAL,
            std::make_shared<FunctionEventListener>([this](const Event& event) { handleHeartbeatSignal(event); })));
        subscriptions_.push_back(bus_->subscribe(topics::MAPPINGS_SIGNAL,
            std::make_shared<FunctionEventListener>([this](const Event& event) { handleMappingsSignal(event); })));
    }

    if (health_worker_) {
        health_worker_->start();
    }

    started_ = true;
    LOGI_FMT("MeshService started");
}

void MeshService::stop() {
    if (!started_) {
        return;
    }

    if (health_worker_) {
        health_worker_->stop();
    }

    if (bus_) {
        for (SubscriptionId id : subscriptions_) {
            if (!bus_->unsubscribe(id)) {
                LOGW_FMT("MeshService::stop: unknown subscription " << id);
            }
        }
    }
    subscriptions_.clear();

    breaker_->stop();
    started_ = false;
    LOGI_FMT("MeshService stopped");
}

std::string MeshService::registerEndpoint(const RegisterRequest& request) {
    return registry_->registerEndpoint(request);
}

void MeshService::deregisterEndpoint(const std::string& instanceId, DeregistrationReason reason) {
    registry_->deregisterEndpoint(instanceId, reason);
}

HeartbeatResponse MeshService::heartbeat(const HeartbeatRequest& request) {
    return registry_->heartbeat(request);
}

EndpointsResult MeshService::getEndpoints(const std::string& appId,
                                          const std::optional<std::string>& serviceName,
                                          bool healthyOnly) {
    return registry_->getEndpoints(appId, serviceName, healthyOnly);
}

EndpointListing MeshService::listEndpoints(const std::string& appIdPrefix,
                                           std::optional<EndpointStatus> statusFilter) {
    return registry_->listEndpoints(appIdPrefix, statusFilter);
}

Route MeshService::getRoute(const std::string& appId,
                            const std::optional<std::string>& serviceName,
                            std::optional<LoadBalancingAlgorithm> algorithm) {
    return router_->resolve(appId, serviceName, algorithm);
}

Route MeshService::getRouteForService(const std::string& serviceName,
                                      std::optional<LoadBalancingAlgorithm> algorithm) {
    return router_->resolveService(serviceName, algorithm);
}

MappingSnapshot MeshService::getMappings(const std::string& serviceNamePrefix) const {
    return mappings_->snapshot(serviceNamePrefix);
}

HealthReport MeshService::getHealth(bool includeEndpoints) {
    HealthReport report;
    report.storeConnected = registry_->isStoreHealthy();
    report.lastUpdateTime = registry_->getLastUpdateTime();

    auto now = clock_->now();
    report.uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_);
    report.uptimeText = formatUptime(report.uptime);

    if (report.storeConnected) {
        try {
            EndpointListing listing = registry_->listEndpoints();
            report.summary = listing.summary;
            if (includeEndpoints) {
                report.endpoints = std::move(listing.endpoints);
            }
        } catch (const MeshException& e) {
            LOGW_FMT("Health listing failed: " << e.what());
            report.storeConnected = false;
        }
    }

    const EndpointSummary& summary = report.summary;
    if (!report.storeConnected || summary.unavailable > summary.healthy) {
        report.status = EndpointStatus::UNAVAILABLE;
    } else if (summary.degraded > 0 || summary.unavailable > 0) {
        report.status = EndpointStatus::DEGRADED;
    } else {
        report.status = EndpointStatus::HEALTHY;
    }
    return report;
}

void MeshService::handleHeartbeatSignal(const Event& event) {
    try {
        const Properties& props = event.getProperties();

        HeartbeatRequest request;
        request.instanceId = props.getString("instanceId");
        request.status = endpointStatusFromString(props.getString("status", "Healthy"));
        request.loadPercent = props.getDouble("loadPercent", 0.0);
        request.currentConnections = props.getInt("currentConnections", 0);
        if (props.has("appId")) {
            request.appId = props.getString("appId");
        }
        if (props.has("serviceNames")) {
            auto names = props.getStringList("serviceNames");
            request.serviceNames = std::set<std::string>(names.begin(), names.end());
        }
        if (props.has("maxConnections")) {
            request.maxConnections = props.getInt("maxConnections");
        }
        if (props.has("issues")) {
            request.issues = props.getStringList("issues");
        }

        registry_->handleHeartbeatSignal(request);
    } catch (const std::exception& e) {
        LOGE_FMT("Failed to handle heartbeat signal: " << e.what());
        publishError("HandleServiceHeartbeat", e);
    }
}

void MeshService::handleMappingsSignal(const Event& event) {
    try {
        const Properties& props = event.getProperties();

        std::optional<int64_t> version;
        if (props.has("version")) {
            version = props.getInt64("version");
        }
        std::string defaultAppId = props.getString("defaultAppId");
        if (defaultAppId.empty()) {
            defaultAppId = config_.registry.default_app_id;
        }

        mappings_->applySnapshot(props.getStringMap("mappings"), version, defaultAppId);
    } catch (const std::exception& e) {
        LOGE_FMT("Failed to handle mappings signal: " << e.what());
        publishError("HandleMappingsChanged", e);
    }
}

std::string MeshService::formatUptime(std::chrono::seconds uptime) {
    int64_t total = uptime.count() < 0 ? 0 : uptime.count();
    int64_t days = total / 86400;
    int64_t hours = (total % 86400) / 3600;
    int64_t minutes = (total % 3600) / 60;
    int64_t seconds = total % 60;

    std::ostringstream out;
    if (days > 0) {
        out << days << "d " << hours << "h " << minutes << "m";
    } else if (hours > 0) {
        out << hours << "h " << minutes << "m";
    } else {
        out << minutes << "m " << seconds << "s";
    }
    return out.str();
}

void MeshService::publishError(const std::string& operation, const std::exception& error) {
    if (!bus_) {
        return;
    }

    Event event(topics::ERROR, origin_);
    event.setProperty("service", std::string("mesh"));
    event.setProperty("operation", operation);
    event.setProperty("message", std::string(error.what()));
    if (const auto* mesh = dynamic_cast<const MeshException*>(&error)) {
        event.setProperty("errorType", std::string(to_string(mesh->code())));
    } else {
        event.setProperty("errorType", std::string("exception"));
    }

    if (!bus_->publish(event)) {
        LOGW_FMT("Failed to publish error event for " << operation);
    }
}

} // namespace meshcore
