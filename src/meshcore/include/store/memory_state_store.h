#ifndef MESHCORE_STORE_MEMORY_STATE_STORE_H
#define MESHCORE_STORE_MEMORY_STATE_STORE_H

#include "store/state_store.h"
#include "utils/clock.h"

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace meshcore {

/**
 * @brief In-process IStateStore
 *
 * Expiry is evaluated lazily against the injected clock: an expired key is
 * removed on the next access. Several mesh processes sharing one instance
 * behave like processes attached to one replicated store.
 *
 * setAvailable(false) simulates an outage: every operation then throws
 * MeshException(DEPENDENCY_UNAVAILABLE) and ping() returns false.
 */
class MemoryStateStore : public IStateStore {
public:
    explicit MemoryStateStore(utils::ClockPtr clock = utils::systemClock());

    std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;

    bool remove(const std::string& key) override;

    bool expire(const std::string& key, std::chrono::milliseconds ttl) override;

    bool setAdd(const std::string& key, const std::string& member) override;

    bool setRemove(const std::string& key, const std::string& member) override;

    std::vector<std::string> setMembers(const std::string& key) override;

    std::optional<std::string> atomicUpdate(const std::string& key,
                                            const UpdateFunction& update) override;

    bool ping() override;

    void setAvailable(bool available) { available_ = available; }

    /**
     * @brief Remaining time to live, nullopt if the key is absent or persistent
     */
    std::optional<std::chrono::milliseconds> ttl(const std::string& key);

    bool exists(const std::string& key);

    size_t keyCount();

private:
    struct Entry {
        bool isSet = false;
        std::string value;
        std::set<std::string> members;
        std::optional<utils::TimePoint> expiresAt;
    };

    void checkAvailable() const;

    /**
     * @brief Find a live entry, dropping it if expired (mutex_ held)
     */
    Entry* findLive(const std::string& key);

    utils::ClockPtr clock_;
    std::atomic<bool> available_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace meshcore

#endif // MESHCORE_STORE_MEMORY_STATE_STORE_H
