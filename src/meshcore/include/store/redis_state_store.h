#ifndef MESHCORE_STORE_REDIS_STATE_STORE_H
#define MESHCORE_STORE_REDIS_STATE_STORE_H

#include "store/redis_connection.h"
#include "store/state_store.h"

#include <mutex>

namespace meshcore {

/**
 * @brief IStateStore backed by a Redis server
 *
 * Every mesh process pointed at the same server shares endpoints and
 * circuit records. String keys map to Redis strings and set keys to Redis
 * sets; TTLs use SET PX and PEXPIRE. atomicUpdate() is an optimistic
 * WATCH/MULTI/EXEC transaction retried on conflict, and keeps the key's
 * remaining TTL (SET KEEPTTL, Redis 6.0 or newer).
 *
 * Calls are serialized over one connection, which is re-established on the
 * next call after a failure.
 */
class RedisStateStore : public IStateStore {
public:
    /**
     * @brief Attempts of one atomicUpdate() before giving up on contention
     */
    static constexpr int MAX_UPDATE_ATTEMPTS = 32;

    explicit RedisStateStore(const RedisConfig& config);

    /**
     * @brief Connect eagerly
     * @throws MeshException(DEPENDENCY_UNAVAILABLE) if the server is unreachable
     */
    void connect();

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

private:
    /**
     * @brief Drop a pending WATCH after the update function declined or threw
     */
    void unwatch();

    std::mutex mutex_;
    RedisConnection connection_;
};

} // namespace meshcore

#endif // MESHCORE_STORE_REDIS_STATE_STORE_H
