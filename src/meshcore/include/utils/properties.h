#ifndef MESHCORE_UTILS_PROPERTIES_H
#define MESHCORE_UTILS_PROPERTIES_H

#include <any>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace meshcore {

/**
 * @brief Thread-safe key-value container carried as a message payload
 *
 * Values are stored as std::any. Typed getters accept the natural C++
 * type and also parse string values, since payloads received from other
 * processes arrive as strings.
 */
class Properties {
public:
    Properties();
    Properties(const Properties& other);
    Properties(Properties&& other) noexcept;
    Properties& operator=(const Properties& other);
    Properties& operator=(Properties&& other) noexcept;

    /**
     * @brief Set a property value
     */
    void set(const std::string& key, const std::any& value);

    /**
     * @brief Get the raw value, or an empty std::any if not present
     */
    std::any get(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get a 64-bit integer (versions, epoch timestamps)
     */
    int64_t getInt64(const std::string& key, int64_t defaultValue = 0) const;

    bool getBool(const std::string& key, bool defaultValue = false) const;

    double getDouble(const std::string& key, double defaultValue = 0.0) const;

    /**
     * @brief Get a string list
     * @return The stored list, or an empty vector if absent or of another type
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    /**
     * @brief Get a string-to-string map (service mapping snapshots)
     */
    std::map<std::string, std::string> getStringMap(const std::string& key) const;

    bool has(const std::string& key) const;

    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    size_t size() const;

    bool empty() const;

    void clear();

    /**
     * @brief Copy every entry of @p other into this container, overwriting
     */
    void merge(const Properties& other);

    /**
     * @brief Get a typed value without conversion
     */
    template<typename T>
    std::optional<T> getAs(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = properties_.find(key);
        if (it == properties_.end()) {
            return std::nullopt;
        }

        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

private:
    std::map<std::string, std::any> properties_;
    mutable std::shared_mutex mutex_;
};

} // namespace meshcore

#endif // MESHCORE_UTILS_PROPERTIES_H
