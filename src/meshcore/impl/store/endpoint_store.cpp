#include "store/endpoint_store.h"
#include "utils/log.h"
#include "utils/string_utils.h"

#include <stdexcept>

namespace meshcore {

EndpointStore::EndpointStore(StateStorePtr store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("EndpointStore requires a state store");
    }
}

std::string EndpointStore::endpointKey(const std::string& instanceId) {
    return ENDPOINT_KEY_PREFIX + instanceId;
}

std::string EndpointStore::appIdKey(const std::string& appId) {
    return APPID_KEY_PREFIX + appId;
}

void EndpointStore::registerEndpoint(const Endpoint& endpoint, std::chrono::seconds ttl) {
    auto previous = readEndpoint(endpoint.instanceId);
    if (previous && previous->appId != endpoint.appId) {
        LOGI_FMT("Endpoint " << endpoint.instanceId << " moved from appId "
                 << previous->appId << " to " << endpoint.appId);
        store_->setRemove(appIdKey(previous->appId), endpoint.instanceId);
    }

    store_->set(endpointKey(endpoint.instanceId), toJson(endpoint).dump(), ttl);
    addToIndexes(endpoint, ttl);
}

void EndpointStore::updateEndpoint(const Endpoint& endpoint, std::chrono::seconds ttl) {
    store_->set(endpointKey(endpoint.instanceId), toJson(endpoint).dump(), ttl);
    addToIndexes(endpoint, ttl);
}

std::optional<EndpointUpdate> EndpointStore::modifyEndpoint(const std::string& instanceId,
                                                            const EndpointMutator& mutator,
                                                            std::chrono::seconds ttl) {
    std::string key = endpointKey(instanceId);
    std::optional<EndpointUpdate> result;

    store_->atomicUpdate(key, [&](const std::optional<std::string>& current) -> std::optional<std::string> {
        // May run more than once when the store retries on conflict
        result.reset();
        if (!current) {
            return std::nullopt;
        }

        Endpoint before;
        try {
            before = endpointFromJson(nlohmann::json::parse(*current));
        } catch (const nlohmann::json::exception& e) {
            LOGE_FMT("Not updating malformed endpoint record " << instanceId << ": " << e.what());
            return std::nullopt;
        }

        Endpoint after = before;
        mutator(after);
        result = EndpointUpdate{before, after};
        return toJson(after).dump();
    });

    if (!result) {
        return std::nullopt;
    }

    // Removed between the update and the TTL refresh
    if (!store_->expire(key, ttl)) {
        return std::nullopt;
    }
    addToIndexes(result->after, ttl);
    return result;
}

void EndpointStore::addToIndexes(const Endpoint& endpoint, std::chrono::seconds ttl) {
    // Every instance in an appId index is also in the global index
    store_->setAdd(ENDPOINT_INDEX_KEY, endpoint.instanceId);

    // The appId index may have expired together with an idle sibling
    std::string indexKey = appIdKey(endpoint.appId);
    store_->setAdd(indexKey, endpoint.instanceId);
    store_->expire(indexKey, ttl);
}

void EndpointStore::deregisterEndpoint(const std::string& instanceId, const std::string& appId) {
    store_->remove(endpointKey(instanceId));
    store_->setRemove(appIdKey(appId), instanceId);
    store_->setRemove(ENDPOINT_INDEX_KEY, instanceId);
}

std::optional<Endpoint> EndpointStore::getEndpoint(const std::string& instanceId) {
    return readEndpoint(instanceId);
}

std::vector<Endpoint> EndpointStore::getEndpointsForApp(const std::string& appId) {
    std::vector<Endpoint> endpoints;
    std::string indexKey = appIdKey(appId);

    for (const auto& instanceId : store_->setMembers(indexKey)) {
        auto endpoint = readEndpoint(instanceId);
        if (!endpoint) {
            store_->setRemove(indexKey, instanceId);
            continue;
        }
        // A stale membership left behind by an appId change
        if (endpoint->appId != appId) {
            store_->setRemove(indexKey, instanceId);
            continue;
        }
        endpoints.push_back(std::move(*endpoint));
    }
    return endpoints;
}

std::vector<Endpoint> EndpointStore::getAllEndpoints(const std::string& appIdPrefix) {
    std::vector<Endpoint> endpoints;

    for (const auto& instanceId : store_->setMembers(ENDPOINT_INDEX_KEY)) {
        auto endpoint = readEndpoint(instanceId);
        if (!endpoint) {
            store_->setRemove(ENDPOINT_INDEX_KEY, instanceId);
            continue;
        }
        if (!appIdPrefix.empty() && !utils::startsWithIgnoreCase(endpoint->appId, appIdPrefix)) {
            continue;
        }
        endpoints.push_back(std::move(*endpoint));
    }
    return endpoints;
}

bool EndpointStore::isHealthy() {
    return store_->ping();
}

std::optional<Endpoint> EndpointStore::readEndpoint(const std::string& instanceId) {
    auto value = store_->get(endpointKey(instanceId));
    if (!value) {
        return std::nullopt;
    }

    try {
        return endpointFromJson(nlohmann::json::parse(*value));
    } catch (const nlohmann::json::exception& e) {
        LOGE_FMT("Discarding malformed endpoint record " << instanceId << ": " << e.what());
        return std::nullopt;
    }
}

} // namespace meshcore
