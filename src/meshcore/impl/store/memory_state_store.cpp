#include "store/memory_state_store.h"
#include "core/mesh_error.h"

#include <stdexcept>

namespace meshcore {

MemoryStateStore::MemoryStateStore(utils::ClockPtr clock)
    : clock_(clock ? std::move(clock) : utils::systemClock())
    , available_(true) {
}

void MemoryStateStore::checkAvailable() const {
    if (!available_) {
        throw MeshException(MeshErrorCode::DEPENDENCY_UNAVAILABLE, "state store is unreachable");
    }
}

MemoryStateStore::Entry* MemoryStateStore::findLive(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expiresAt && *it->second.expiresAt <= clock_->now()) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> MemoryStateStore::get(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) {
        return std::nullopt;
    }
    if (entry->isSet) {
        throw std::logic_error("WRONGTYPE: key '" + key + "' holds a set");
    }
    return entry->value;
}

void MemoryStateStore::set(const std::string& key, const std::string& value,
                           std::optional<std::chrono::milliseconds> ttl) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry;
    entry.value = value;
    if (ttl) {
        entry.expiresAt = clock_->now() + *ttl;
    }
    entries_[key] = std::move(entry);
}

bool MemoryStateStore::remove(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!findLive(key)) {
        return false;
    }
    entries_.erase(key);
    return true;
}

bool MemoryStateStore::expire(const std::string& key, std::chrono::milliseconds ttl) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) {
        return false;
    }
    entry->expiresAt = clock_->now() + ttl;
    return true;
}

bool MemoryStateStore::setAdd(const std::string& key, const std::string& member) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry) {
        entry = &entries_[key];
        entry->isSet = true;
    } else if (!entry->isSet) {
        throw std::logic_error("WRONGTYPE: key '" + key + "' holds a string");
    }
    return entry->members.insert(member).second;
}

bool MemoryStateStore::setRemove(const std::string& key, const std::string& member) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry || !entry->isSet) {
        return false;
    }
    bool removed = entry->members.erase(member) > 0;
    if (entry->members.empty()) {
        entries_.erase(key);
    }
    return removed;
}

std::vector<std::string> MemoryStateStore::setMembers(const std::string& key) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry || !entry->isSet) {
        return {};
    }
    return std::vector<std::string>(entry->members.begin(), entry->members.end());
}

std::optional<std::string> MemoryStateStore::atomicUpdate(const std::string& key,
                                                          const UpdateFunction& update) {
    checkAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (entry && entry->isSet) {
        throw std::logic_error("WRONGTYPE: key '" + key + "' holds a set");
    }

    std::optional<std::string> current;
    if (entry) {
        current = entry->value;
    }

    std::optional<std::string> next = update(current);
    if (!next) {
        return current;
    }

    if (entry) {
        entry->value = *next;
    } else {
        entries_[key].value = *next;
    }
    return next;
}

bool MemoryStateStore::ping() {
    return available_;
}

std::optional<std::chrono::milliseconds> MemoryStateStore::ttl(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = findLive(key);
    if (!entry || !entry->expiresAt) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*entry->expiresAt - clock_->now());
}

bool MemoryStateStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLive(key) != nullptr;
}

size_t MemoryStateStore::keyCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    auto now = clock_->now();
    for (const auto& kv : entries_) {
        if (!kv.second.expiresAt || *kv.second.expiresAt > now) {
            ++count;
        }
    }
    return count;
}

} // namespace meshcore
