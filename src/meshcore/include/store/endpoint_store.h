#ifndef MESHCORE_STORE_ENDPOINT_STORE_H
#define MESHCORE_STORE_ENDPOINT_STORE_H

#include "registry/endpoint.h"
#include "store/state_store.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Endpoint records and their indexes on top of an IStateStore
 *
 * Layout:
 * - "mesh:endpoint:{instanceId}" endpoint JSON, expires after the TTL
 * - "mesh:appid:{appId}" set of instance IDs, TTL refreshed on heartbeat
 * - "mesh:endpoint-index" set of every instance ID, never expires
 *
 * Index members whose record has expired are removed lazily by the reads
 * that encounter them. Store failures propagate as
 * MeshException(DEPENDENCY_UNAVAILABLE).
 */
/**
 * @brief Result of EndpointStore::modifyEndpoint()
 */
struct EndpointUpdate {
    Endpoint before;
    Endpoint after;
};

class EndpointStore {
public:
    using EndpointMutator = std::function<void(Endpoint& endpoint)>;

    static constexpr const char* ENDPOINT_KEY_PREFIX = "mesh:endpoint:";
    static constexpr const char* APPID_KEY_PREFIX = "mesh:appid:";
    static constexpr const char* ENDPOINT_INDEX_KEY = "mesh:endpoint-index";

    explicit EndpointStore(StateStorePtr store);

    /**
     * @brief Write (or overwrite) an endpoint and add it to both indexes
     *
     * If the instance was previously registered under a different appId it
     * is removed from that appId's index.
     */
    void registerEndpoint(const Endpoint& endpoint, std::chrono::seconds ttl);

    /**
     * @brief Rewrite an existing endpoint, refreshing its TTL and its appId index TTL
     */
    void updateEndpoint(const Endpoint& endpoint, std::chrono::seconds ttl);

    /**
     * @brief Atomically modify an existing endpoint and refresh its TTLs
     *
     * The read-modify-write happens in one atomicUpdate() of the endpoint
     * key, so an endpoint removed concurrently is never written back.
     *
     * @return nullopt if the endpoint is unknown, expired or removed
     *         meanwhile; nothing is written in that case
     */
    std::optional<EndpointUpdate> modifyEndpoint(const std::string& instanceId,
                                                 const EndpointMutator& mutator,
                                                 std::chrono::seconds ttl);

    /**
     * @brief Remove the record and both index memberships
     */
    void deregisterEndpoint(const std::string& instanceId, const std::string& appId);

    /**
     * @return nullopt if unknown or expired
     */
    std::optional<Endpoint> getEndpoint(const std::string& instanceId);

    /**
     * @brief Every non-expired endpoint in the appId index
     */
    std::vector<Endpoint> getEndpointsForApp(const std::string& appId);

    /**
     * @brief Every non-expired endpoint in the global index
     * @param appIdPrefix Case-insensitive appId prefix (empty = all)
     */
    std::vector<Endpoint> getAllEndpoints(const std::string& appIdPrefix = "");

    /**
     * @brief Ping the underlying store
     */
    bool isHealthy();

    static std::string endpointKey(const std::string& instanceId);

    static std::string appIdKey(const std::string& appId);

private:
    std::optional<Endpoint> readEndpoint(const std::string& instanceId);

    void addToIndexes(const Endpoint& endpoint, std::chrono::seconds ttl);

    StateStorePtr store_;
};

using EndpointStorePtr = std::shared_ptr<EndpointStore>;

} // namespace meshcore

#endif // MESHCORE_STORE_ENDPOINT_STORE_H
