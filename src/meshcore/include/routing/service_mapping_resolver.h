#ifndef MESHCORE_ROUTING_SERVICE_MAPPING_RESOLVER_H
#define MESHCORE_ROUTING_SERVICE_MAPPING_RESOLVER_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace meshcore {

/**
 * @brief A copy of the service mapping table
 */
struct MappingSnapshot {
    std::map<std::string, std::string> mappings;
    std::string defaultAppId;
    int64_t version = 0;
};

/**
 * @brief Service name to appId table with a default appId
 *
 * The table is only ever replaced as a whole. Service names without an
 * entry resolve to the default appId, so an empty snapshot points every
 * service at the default.
 */
class ServiceMappingResolver {
public:
    explicit ServiceMappingResolver(const std::string& defaultAppId = "default");

    /**
     * @brief appId for a service name (the default appId if unmapped)
     */
    std::string resolve(const std::string& serviceName) const;

    /**
     * @brief Replace the table
     *
     * A versioned snapshot must carry a version greater than the current
     * one (any version is accepted while the table has never been
     * versioned). An unversioned snapshot always applies and advances the
     * version by one.
     *
     * @param defaultAppId New default appId, if the snapshot carries one
     * @return false if the snapshot was rejected as stale
     */
    bool applySnapshot(const std::map<std::string, std::string>& mappings,
                       std::optional<int64_t> version = std::nullopt,
                       const std::optional<std::string>& defaultAppId = std::nullopt);

    /**
     * @param serviceNamePrefix Case-insensitive prefix filter (empty = all)
     */
    MappingSnapshot snapshot(const std::string& serviceNamePrefix = "") const;

    int64_t getVersion() const;

    std::string getDefaultAppId() const;

    /**
     * @brief Drop every mapping and the version, keeping the default appId
     */
    void reset();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string> mappings_;
    std::string defaultAppId_;
    int64_t version_;
};

using ServiceMappingResolverPtr = std::shared_ptr<ServiceMappingResolver>;

} // namespace meshcore

#endif // MESHCORE_ROUTING_SERVICE_MAPPING_RESOLVER_H
