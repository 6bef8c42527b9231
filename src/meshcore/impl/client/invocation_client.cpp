#include "client/invocation_client.h"
#include "core/mesh_error.h"
#include "utils/log.h"

#include <stdexcept>

namespace meshcore {

namespace {

enum class Outcome {
    NONE,
    NO_ENDPOINT,
    STATUS,
    CONNECTION
};

} // anonymous namespace

InvocationClient::InvocationClient(const InvocationConfig& config,
                                   RouterPtr router,
                                   HttpTransportPtr transport,
                                   std::shared_ptr<DistributedCircuitBreaker> breaker,
                                   utils::ClockPtr clock)
    : config_(config)
    , router_(std::move(router))
    , transport_(std::move(transport))
    , breaker_(std::move(breaker))
    , retry_policy_(config.retry)
    , cache_(config.endpoint_cache_ttl, config.endpoint_cache_max_size, std::move(clock)) {
    if (!router_) {
        throw std::invalid_argument("InvocationClient requires a router");
    }
    if (!transport_) {
        throw std::invalid_argument("InvocationClient requires an HTTP transport");
    }
}

HttpResponse InvocationClient::invoke(const std::string& appId,
                                      const std::string& method,
                                      const InvocationRequest& request) {
    return execute(appId, method, request, true);
}

HttpResponse InvocationClient::invokeRaw(const std::string& appId,
                                         const std::string& method,
                                         const InvocationRequest& request) {
    return execute(appId, method, request, false);
}

HttpResponse InvocationClient::invokeService(const std::string& serviceName,
                                             const std::string& method,
                                             const InvocationRequest& request) {
    if (serviceName.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "service name must not be empty");
    }
    std::string appId = router_->getMappings()->resolve(serviceName);
    LOGD_FMT("Service " << serviceName << " maps to appId " << appId);
    return execute(appId, method, request, true);
}

nlohmann::json InvocationClient::invokeJson(const std::string& appId,
                                            const std::string& method,
                                            const nlohmann::json& body,
                                            const std::string& http_method) {
    InvocationRequest request;
    request.http_method = http_method;
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    if (!body.is_null()) {
        request.body = body.dump();
    }

    HttpResponse response = invoke(appId, method, request);
    if (!response.isSuccess()) {
        throw MeshException(MeshErrorCode::TERMINAL_UPSTREAM,
                            appId + "/" + method + " returned " + std::to_string(response.status)
                                + ": " + response.body,
                            response.status);
    }

    if (response.body.empty()) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw MeshException(MeshErrorCode::TERMINAL_UPSTREAM,
                            "invalid JSON from " + appId + "/" + method + ": " + e.what(),
                            response.status);
    }
}

bool InvocationClient::isServiceAvailable(const std::string& appId) {
    try {
        return resolveEndpoint(appId).has_value();
    } catch (const MeshException& e) {
        LOGW_FMT("Availability check for " << appId << " failed: " << e.what());
        return false;
    }
}

std::string InvocationClient::buildTarget(const std::string& method) {
    size_t start = method.find_first_not_of('/');
    return "/" + (start == std::string::npos ? std::string() : method.substr(start));
}

std::optional<Endpoint> InvocationClient::resolveEndpoint(const std::string& appId) {
    if (auto cached = cache_.get(appId)) {
        return cached;
    }

    try {
        Route route = router_->resolve(appId);
        cache_.put(appId, route.primary);
        return route.primary;
    } catch (const MeshException& e) {
        if (e.code() != MeshErrorCode::NOT_FOUND) {
            throw;
        }
        LOGW_FMT("No endpoints available for " << appId);
        return std::nullopt;
    }
}

HttpResponse InvocationClient::execute(const std::string& appId,
                                       const std::string& method,
                                       const InvocationRequest& request,
                                       bool use_breaker) {
    if (appId.empty()) {
        throw MeshException(MeshErrorCode::INVALID_ARGUMENT, "appId must not be empty");
    }

    bool breaker_active = use_breaker && breaker_ && breaker_->isEnabled();
    if (breaker_active && !breaker_->isCallAllowed(appId)) {
        LOGW_FMT("Circuit breaker open for " << appId << ", rejecting call to " << method);
        throw MeshException(MeshErrorCode::CIRCUIT_OPEN, "circuit open for " + appId);
    }

    const uint32_t max_attempts = config_.retry.max_retries + 1;
    Outcome last = Outcome::NONE;
    HttpResponse last_response;
    std::string last_error;

    for (uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
        if (attempt > 0) {
            cache_.invalidate(appId);
            retry_policy_.backoff(attempt);
        }

        std::optional<Endpoint> endpoint = resolveEndpoint(appId);
        if (!endpoint) {
            last = Outcome::NO_ENDPOINT;
            continue;
        }

        HttpRequest http;
        http.method = request.http_method;
        http.scheme = schemeFor(endpoint->port);
        http.host = endpoint->host;
        http.port = endpoint->port;
        http.target = buildTarget(method);
        http.headers = request.headers;
        http.body = request.body;
        http.connect_timeout = config_.connect_timeout;
        http.request_timeout = config_.request_timeout;

        if (attempt == 0) {
            LOGD_FMT("Invoking " << method << " on " << appId << " at " << http.url());
        }

        TransportResult<HttpResponse> result = transport_->send(http);
        if (!result) {
            last = Outcome::CONNECTION;
            last_error = result.error_message;
            cache_.invalidate(appId);
            LOGD_FMT("Connection failure to " << appId << " (" << to_string(result.error) << "): "
                     << result.error_message << ", " << (max_attempts - attempt - 1) << " retries remaining");
            continue;
        }

        if (!RetryPolicy::isTransientStatus(result.value.status)) {
            if (breaker_active) {
                breaker_->recordSuccess(appId);
            }
            return std::move(result.value);
        }

        last = Outcome::STATUS;
        last_response = std::move(result.value);
        LOGD_FMT("Transient status " << last_response.status << " from " << appId << ", "
                 << (max_attempts - attempt - 1) << " retries remaining");
    }

    if (breaker_active) {
        breaker_->recordFailure(appId);
    }

    switch (last) {
        case Outcome::STATUS:
            LOGW_FMT("Invocation of " << method << " on " << appId << " failed with status "
                     << last_response.status << " after " << max_attempts << " attempts");
            throw MeshException(MeshErrorCode::TERMINAL_UPSTREAM,
                                appId + "/" + method + " returned " + std::to_string(last_response.status),
                                last_response.status);
        case Outcome::CONNECTION:
            LOGW_FMT("Invocation of " << method << " on " << appId << " failed: " << last_error);
            throw MeshException(MeshErrorCode::TRANSIENT_UPSTREAM,
                                appId + "/" + method + ": " + last_error);
        default:
            throw MeshException(MeshErrorCode::NOT_FOUND, "no endpoints available for " + appId);
    }
}

} // namespace meshcore
