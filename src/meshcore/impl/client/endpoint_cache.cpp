#include "client/endpoint_cache.h"

#include <algorithm>

namespace meshcore {

EndpointCache::EndpointCache(std::chrono::seconds ttl, size_t max_size, utils::ClockPtr clock)
    : ttl_(ttl)
    , max_size_(max_size)
    , clock_(clock ? std::move(clock) : utils::systemClock()) {
}

std::optional<Endpoint> EndpointCache::get(const std::string& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(appId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (clock_->now() >= it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.endpoint;
}

void EndpointCache::put(const std::string& appId, const Endpoint& endpoint) {
    if (ttl_.count() <= 0) {
        return;
    }

    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (max_size_ > 0 && entries_.count(appId) == 0) {
        while (entries_.size() >= max_size_) {
            auto oldest = std::min_element(entries_.begin(), entries_.end(),
                [](const auto& a, const auto& b) { return a.second.expires_at < b.second.expires_at; });
            entries_.erase(oldest);
        }
    }

    entries_[appId] = Entry{endpoint, now + ttl_};
}

void EndpointCache::invalidate(const std::string& appId) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(appId);
}

void EndpointCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t EndpointCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace meshcore
