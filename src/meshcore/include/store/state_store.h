#ifndef MESHCORE_STORE_STATE_STORE_H
#define MESHCORE_STORE_STATE_STORE_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Replicated key-value store shared by every mesh process
 *
 * Keys hold either a string value or a set of strings, optionally with a
 * TTL after which they read as absent. Single-key operations are atomic;
 * there is no multi-key transaction.
 *
 * Every operation throws MeshException(DEPENDENCY_UNAVAILABLE) when the
 * store cannot be reached.
 */
class IStateStore {
public:
    /**
     * @brief Read-modify-write function for atomicUpdate()
     *
     * Receives the current value (nullopt if absent) and returns the value
     * to store, or nullopt to leave the key untouched.
     */
    using UpdateFunction =
        std::function<std::optional<std::string>(const std::optional<std::string>& current)>;

    virtual ~IStateStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Write a string value
     * @param ttl Expiry from now; nullopt removes any existing expiry
     */
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;

    /**
     * @return true if the key existed
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Set or refresh the expiry of an existing key
     * @return false if the key does not exist
     */
    virtual bool expire(const std::string& key, std::chrono::milliseconds ttl) = 0;

    /**
     * @brief Add a member to a set value, creating the set if needed
     * @return true if the member was not present
     */
    virtual bool setAdd(const std::string& key, const std::string& member) = 0;

    /**
     * @return true if the member was present
     */
    virtual bool setRemove(const std::string& key, const std::string& member) = 0;

    virtual std::vector<std::string> setMembers(const std::string& key) = 0;

    /**
     * @brief Atomic single-key read-modify-write
     *
     * Concurrent updates of the same key never interleave.
     *
     * @return The value stored after the update (the current value if the
     *         function declined to write)
     */
    virtual std::optional<std::string> atomicUpdate(const std::string& key,
                                                    const UpdateFunction& update) = 0;

    /**
     * @brief Check reachability
     * @return false if the store is unreachable (never throws)
     */
    virtual bool ping() = 0;
};

using StateStorePtr = std::shared_ptr<IStateStore>;

} // namespace meshcore

#endif // MESHCORE_STORE_STATE_STORE_H
