#include "registry/registry_service.h"
#include "core/mesh_error.h"
#include "core/mesh_topics.h"
#include "utils/log.h"

#include <algorithm>
#include <stdexcept>

namespace meshcore {

RegistryService::RegistryService(const RegistryConfig& config,
                                 EndpointStorePtr store,
                                 MessageBusPtr bus,
                                 const std::string& origin,
                                 utils::ClockPtr clock)
    : config_(config)
    , store_(std::move(store))
    , bus_(std::move(bus))
    , origin_(origin)
    , clock_(clock ? std::move(clock) : utils::systemClock()) {
    if (!store_) {
        throw std::invalid_argument("RegistryService requires an endpoint store");
    }
}

std::string RegistryService::registerEndpoint(const RegisterRequest& request) {
    if (request.appId.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "appId must not be empty");
    }
    if (request.host.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "host must not be empty");
    }
    if (request.port <= 0 || request.port > 65535) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT,
                            "port out of range: " + std::to_string(request.port));
    }

    auto now = clock_->now();

    Endpoint endpoint;
    endpoint.instanceId = request.instanceId && !request.instanceId->empty()
        ? *request.instanceId : generateInstanceId();
    endpoint.appId = request.appId;
    endpoint.serviceNames = request.serviceNames;
    endpoint.host = request.host;
    endpoint.port = request.port;
    endpoint.status = EndpointStatus::HEALTHY;
    endpoint.maxConnections = request.maxConnections.value_or(config_.default_max_connections);
    endpoint.currentConnections = 0;
    endpoint.loadPercent = 0.0;
    endpoint.lastHeartbeatAt = now;
    endpoint.registeredAt = now;

    store_->registerEndpoint(endpoint, config_.endpoint_ttl);
    touch();

    LOGI_FMT("Registered endpoint " << endpoint.instanceId << " for appId " << endpoint.appId
             << " at " << endpoint.host << ":" << endpoint.port);
    publishRegistered(endpoint);
    return endpoint.instanceId;
}

void RegistryService::deregisterEndpoint(const std::string& instanceId, DeregistrationReason reason) {
    auto existing = store_->getEndpoint(instanceId);
    if (!existing) {
        throw MeshException(MeshErrorCode::NOT_FOUND, "endpoint not registered: " + instanceId);
    }

    store_->deregisterEndpoint(instanceId, existing->appId);
    touch();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = degradedPublished_.begin(); it != degradedPublished_.end();) {
            if (it->first.compare(0, instanceId.size() + 1, instanceId + "|") == 0) {
                it = degradedPublished_.erase(it);
            } else {
                ++it;
            }
        }
    }

    LOGI_FMT("Deregistered endpoint " << instanceId << " (" << existing->appId
             << "), reason " << to_string(reason));

    Event event(topics::ENDPOINT_DEREGISTERED, origin_);
    event.setProperty("instanceId", instanceId);
    event.setProperty("appId", existing->appId);
    event.setProperty("reason", std::string(to_string(reason)));
    publish(event);
}

HeartbeatResponse RegistryService::heartbeat(const HeartbeatRequest& request) {
    return applyHeartbeat(request, false);
}

HeartbeatResponse RegistryService::handleHeartbeatSignal(const HeartbeatRequest& request) {
    return applyHeartbeat(request, true);
}

HeartbeatResponse RegistryService::applyHeartbeat(const HeartbeatRequest& request,
                                                  bool keepIssuesWhenAbsent) {
    if (request.instanceId.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "instanceId must not be empty");
    }

    HeartbeatResponse response;
    response.nextHeartbeat = config_.heartbeat_interval;
    response.ttl = config_.endpoint_ttl;

    auto now = clock_->now();
    double load = std::min(std::max(request.loadPercent, 0.0), 100.0);
    int connections = std::max(request.currentConnections, 0);

    auto existing = store_->getEndpoint(request.instanceId);
    if (!existing) {
        if (!request.appId || request.appId->empty()) {
            throw MeshException(MeshErrorCode::NOT_FOUND,
                                "heartbeat for unknown endpoint: " + request.instanceId);
        }

        Endpoint endpoint;
        endpoint.instanceId = request.instanceId;
        endpoint.appId = *request.appId;
        endpoint.serviceNames = request.serviceNames.value_or(std::set<std::string>{});
        endpoint.host = *request.appId;
        endpoint.port = config_.endpoint_port;
        endpoint.status = request.status;
        endpoint.maxConnections = request.maxConnections.value_or(config_.default_max_connections);
        endpoint.currentConnections = connections;
        endpoint.loadPercent = load;
        endpoint.issues = request.issues.value_or(std::vector<std::string>{});
        endpoint.lastHeartbeatAt = now;
        endpoint.registeredAt = now;

        store_->registerEndpoint(endpoint, config_.endpoint_ttl);
        touch();

        LOGI_FMT("Auto-registered endpoint " << endpoint.instanceId << " for appId "
                 << endpoint.appId << " from heartbeat");
        publishRegistered(endpoint);
        response.registered = true;
        return response;
    }

    auto update = store_->modifyEndpoint(request.instanceId, [&](Endpoint& endpoint) {
        endpoint.status = request.status;
        endpoint.loadPercent = load;
        endpoint.currentConnections = connections;
        if (request.maxConnections) {
            endpoint.maxConnections = *request.maxConnections;
        }
        if (request.issues) {
            endpoint.issues = *request.issues;
        } else if (!keepIssuesWhenAbsent) {
            endpoint.issues.clear();
        }
        endpoint.lastHeartbeatAt = now;
    }, config_.endpoint_ttl);

    if (!update) {
        throw MeshException(MeshErrorCode::NOT_FOUND,
                            "endpoint deregistered during heartbeat: " + request.instanceId);
    }
    touch();

    const Endpoint& endpoint = update->after;
    EndpointStatus previous = update->before.status;

    LOGD_FMT("Heartbeat from " << endpoint.instanceId << ": " << to_string(endpoint.status)
             << ", load " << endpoint.loadPercent << "%, connections " << endpoint.currentConnections);

    maybePublishDegraded(endpoint, previous);
    return response;
}

EndpointsResult RegistryService::getEndpoints(const std::string& appId,
                                              const std::optional<std::string>& serviceName,
                                              bool healthyOnly) {
    if (appId.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "appId must not be empty");
    }

    auto now = clock_->now();
    EndpointsResult result;
    for (auto& stored : store_->getEndpointsForApp(appId)) {
        if (serviceName && !serviceName->empty() && !stored.servesService(*serviceName)) {
            continue;
        }
        Endpoint endpoint = withEffectiveStatus(std::move(stored), now);
        ++result.totalCount;
        if (endpoint.status == EndpointStatus::HEALTHY) {
            ++result.healthyCount;
        } else if (healthyOnly) {
            continue;
        }
        result.endpoints.push_back(std::move(endpoint));
    }
    return result;
}

EndpointListing RegistryService::listEndpoints(const std::string& appIdPrefix,
                                               std::optional<EndpointStatus> statusFilter) {
    auto now = clock_->now();
    EndpointListing listing;
    for (auto& stored : store_->getAllEndpoints(appIdPrefix)) {
        Endpoint endpoint = withEffectiveStatus(std::move(stored), now);
        if (statusFilter && endpoint.status != *statusFilter) {
            continue;
        }
        listing.endpoints.push_back(std::move(endpoint));
    }
    listing.summary = summarize(listing.endpoints);
    return listing;
}

Endpoint RegistryService::getEndpoint(const std::string& instanceId) {
    auto endpoint = store_->getEndpoint(instanceId);
    if (!endpoint) {
        throw MeshException(MeshErrorCode::NOT_FOUND, "endpoint not registered: " + instanceId);
    }
    return withEffectiveStatus(std::move(*endpoint), clock_->now());
}

bool RegistryService::isStoreHealthy() {
    return store_->isHealthy();
}

std::optional<utils::TimePoint> RegistryService::getLastUpdateTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastUpdate_;
}

EndpointSummary RegistryService::summarize(const std::vector<Endpoint>& endpoints) {
    EndpointSummary summary;
    std::set<std::string> appIds;
    for (const auto& endpoint : endpoints) {
        ++summary.total;
        appIds.insert(endpoint.appId);
        switch (endpoint.status) {
            case EndpointStatus::HEALTHY:
                ++summary.healthy;
                ++summary.healthyByAppId[endpoint.appId];
                break;
            case EndpointStatus::DEGRADED:
                ++summary.degraded;
                break;
            case EndpointStatus::UNAVAILABLE:
                ++summary.unavailable;
                break;
            case EndpointStatus::SHUTTING_DOWN:
                ++summary.shuttingDown;
                break;
        }
    }
    summary.uniqueAppIds = appIds.size();
    return summary;
}

Endpoint RegistryService::withEffectiveStatus(Endpoint endpoint, utils::TimePoint now) const {
    endpoint.status = endpoint.effectiveStatus(now, config_.degradation_threshold);
    return endpoint;
}

DegradationReason RegistryService::degradationReason(const Endpoint& endpoint) const {
    if (endpoint.loadPercent > config_.load_threshold_percent) {
        return DegradationReason::HIGH_LOAD;
    }
    if (endpoint.maxConnections > 0 && endpoint.currentConnections >= endpoint.maxConnections) {
        return DegradationReason::HIGH_CONNECTION_COUNT;
    }
    return DegradationReason::MISSED_HEARTBEAT;
}

void RegistryService::maybePublishDegraded(const Endpoint& endpoint, EndpointStatus previous) {
    if (previous != EndpointStatus::HEALTHY || endpoint.status != EndpointStatus::DEGRADED) {
        return;
    }

    DegradationReason reason = degradationReason(endpoint);
    auto now = clock_->now();
    auto window = config_.degradation_event_dedup_window;

    if (window.count() > 0) {
        std::string key = endpoint.instanceId + "|" + to_string(reason);
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto it = degradedPublished_.begin(); it != degradedPublished_.end();) {
            if (now - it->second >= window) {
                it = degradedPublished_.erase(it);
            } else {
                ++it;
            }
        }

        if (degradedPublished_.count(key) > 0) {
            LOGD_FMT("Suppressing duplicate degradation event for " << endpoint.instanceId
                     << " (" << to_string(reason) << ")");
            return;
        }
        degradedPublished_[key] = now;
    }

    LOGW_FMT("Endpoint " << endpoint.instanceId << " (" << endpoint.appId << ") degraded: "
             << to_string(reason));

    Event event(topics::ENDPOINT_DEGRADED, origin_);
    event.setProperty("instanceId", endpoint.instanceId);
    event.setProperty("appId", endpoint.appId);
    event.setProperty("reason", std::string(to_string(reason)));
    event.setProperty("previousStatus", std::string(to_string(previous)));
    event.setProperty("loadPercent", endpoint.loadPercent);
    event.setProperty("currentConnections", endpoint.currentConnections);
    event.setProperty("maxConnections", endpoint.maxConnections);
    publish(event);
}

void RegistryService::publishRegistered(const Endpoint& endpoint) {
    Event event(topics::ENDPOINT_REGISTERED, origin_);
    event.setProperty("instanceId", endpoint.instanceId);
    event.setProperty("appId", endpoint.appId);
    event.setProperty("host", endpoint.host);
    event.setProperty("port", endpoint.port);
    event.setProperty("serviceNames",
                      std::vector<std::string>(endpoint.serviceNames.begin(), endpoint.serviceNames.end()));
    publish(event);
}

void RegistryService::publish(const Event& event) {
    if (!bus_) {
        return;
    }
    if (!bus_->publish(event)) {
        LOGW_FMT("Failed to publish " << event.getTopic() << " event");
    }
}

void RegistryService::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastUpdate_ = clock_->now();
}

} // namespace meshcore
