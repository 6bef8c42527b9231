#ifndef MESHCORE_CLIENT_ENDPOINT_CACHE_H
#define MESHCORE_CLIENT_ENDPOINT_CACHE_H

#include "registry/endpoint.h"
#include "utils/clock.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace meshcore {

/**
 * @brief Short-lived appId to endpoint cache for the invocation client
 *
 * Entries expire after the TTL. With a non-zero max size the entry closest
 * to expiry is evicted to make room. A TTL of zero disables caching.
 */
class EndpointCache {
public:
    EndpointCache(std::chrono::seconds ttl,
                  size_t max_size = 0,
                  utils::ClockPtr clock = utils::systemClock());

    std::optional<Endpoint> get(const std::string& appId);

    void put(const std::string& appId, const Endpoint& endpoint);

    void invalidate(const std::string& appId);

    void clear();

    size_t size() const;

private:
    struct Entry {
        Endpoint endpoint;
        utils::TimePoint expires_at;
    };

    std::chrono::seconds ttl_;
    size_t max_size_;
    utils::ClockPtr clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace meshcore

#endif // MESHCORE_CLIENT_ENDPOINT_CACHE_H
