#include "routing/service_mapping_resolver.h"
#include "utils/log.h"
#include "utils/string_utils.h"

#include <mutex>
#include <stdexcept>

namespace meshcore {

ServiceMappingResolver::ServiceMappingResolver(const std::string& defaultAppId)
    : defaultAppId_(defaultAppId)
    , version_(0) {
    if (defaultAppId_.empty()) {
        throw std::invalid_argument("Default appId must not be empty");
    }
}

std::string ServiceMappingResolver::resolve(const std::string& serviceName) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = mappings_.find(serviceName);
    return it != mappings_.end() ? it->second : defaultAppId_;
}

bool ServiceMappingResolver::applySnapshot(const std::map<std::string, std::string>& mappings,
                                           std::optional<int64_t> version,
                                           const std::optional<std::string>& defaultAppId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (version && version_ > 0 && *version <= version_) {
        LOGD_FMT("Rejecting stale mappings update: version " << *version << " <= current " << version_);
        return false;
    }

    mappings_ = mappings;
    if (defaultAppId && !defaultAppId->empty()) {
        defaultAppId_ = *defaultAppId;
    }
    version_ = version ? *version : version_ + 1;

    if (mappings_.empty()) {
        LOGI_FMT("Empty mapping snapshot, all services now route to " << defaultAppId_
                 << " (version " << version_ << ")");
    } else {
        LOGI_FMT("Updated service mappings to version " << version_ << " with "
                 << mappings_.size() << " mappings");
    }
    return true;
}

MappingSnapshot ServiceMappingResolver::snapshot(const std::string& serviceNamePrefix) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    MappingSnapshot result;
    result.defaultAppId = defaultAppId_;
    result.version = version_;
    for (const auto& kv : mappings_) {
        if (serviceNamePrefix.empty() || utils::startsWithIgnoreCase(kv.first, serviceNamePrefix)) {
            result.mappings.insert(kv);
        }
    }
    return result;
}

int64_t ServiceMappingResolver::getVersion() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return version_;
}

std::string ServiceMappingResolver::getDefaultAppId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return defaultAppId_;
}

void ServiceMappingResolver::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    mappings_.clear();
    version_ = 0;
}

} // namespace meshcore
