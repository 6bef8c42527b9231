#ifndef MESHCORE_CLIENT_INVOCATION_CLIENT_H
#define MESHCORE_CLIENT_INVOCATION_CLIENT_H

#include "client/endpoint_cache.h"
#include "client/http_transport.h"
#include "config/mesh_config.h"
#include "resilience/distributed_circuit_breaker.h"
#include "resilience/retry_policy.h"
#include "routing/router.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace meshcore {

/**
 * @brief Payload of a service invocation
 */
struct InvocationRequest {
    std::string http_method = "POST";
    std::map<std::string, std::string> headers;
    std::string body;
};

/**
 * @brief Calls a method on some endpoint of an appId
 *
 * One invocation:
 * 1. Fails fast with CIRCUIT_OPEN if the breaker rejects the appId.
 * 2. Takes the endpoint from the cache, or resolves it through the Router.
 * 3. Sends {scheme}://{host}:{port}/{method}, https when the port is 443.
 * 4. A non-transient status is returned as is and counts as a success.
 * 5. Transient statuses, connection errors and unresolvable appIds are
 *    retried with exponential backoff after dropping the cached endpoint.
 * 6. When the retries are exhausted the breaker records one failure and
 *    the last outcome is raised as TERMINAL_UPSTREAM (status),
 *    TRANSIENT_UPSTREAM (connection error) or NOT_FOUND (no endpoint).
 *
 * Store outages during resolution surface at once as
 * DEPENDENCY_UNAVAILABLE.
 */
class InvocationClient {
public:
    /**
     * @param breaker Shared breaker; null disables circuit breaking
     */
    InvocationClient(const InvocationConfig& config,
                     RouterPtr router,
                     HttpTransportPtr transport,
                     std::shared_ptr<DistributedCircuitBreaker> breaker = nullptr,
                     utils::ClockPtr clock = utils::systemClock());

    HttpResponse invoke(const std::string& appId,
                        const std::string& method,
                        const InvocationRequest& request = InvocationRequest());

    /**
     * @brief invoke() without consulting or updating the circuit breaker
     */
    HttpResponse invokeRaw(const std::string& appId,
                           const std::string& method,
                           const InvocationRequest& request = InvocationRequest());

    /**
     * @brief Resolve the service name to an appId through the mapping table, then invoke()
     */
    HttpResponse invokeService(const std::string& serviceName,
                               const std::string& method,
                               const InvocationRequest& request = InvocationRequest());

    /**
     * @brief invoke() with a JSON body and a JSON response
     * @return Parsed response body, null for an empty body
     * @throws MeshException TERMINAL_UPSTREAM on a non-2xx final status or
     *         an unparseable response body
     */
    nlohmann::json invokeJson(const std::string& appId,
                              const std::string& method,
                              const nlohmann::json& body,
                              const std::string& http_method = "POST");

    /**
     * @return true if an endpoint for the appId resolves
     */
    bool isServiceAvailable(const std::string& appId);

    RetryPolicy& getRetryPolicy() { return retry_policy_; }

    EndpointCache& getEndpointCache() { return cache_; }

    static std::string buildTarget(const std::string& method);

    static std::string schemeFor(int port) { return port == 443 ? "https" : "http"; }

private:
    HttpResponse execute(const std::string& appId,
                         const std::string& method,
                         const InvocationRequest& request,
                         bool use_breaker);

    std::optional<Endpoint> resolveEndpoint(const std::string& appId);

    InvocationConfig config_;
    RouterPtr router_;
    HttpTransportPtr transport_;
    std::shared_ptr<DistributedCircuitBreaker> breaker_;
    RetryPolicy retry_policy_;
    EndpointCache cache_;
};

using InvocationClientPtr = std::shared_ptr<InvocationClient>;

} // namespace meshcore

#endif // MESHCORE_CLIENT_INVOCATION_CLIENT_H
