#include "utils/properties.h"

#include <mutex>

namespace meshcore {

namespace {

// Typed payload values win; otherwise fall back to a string representation
std::optional<std::string> asText(const std::any& value) {
    if (const auto* s = std::any_cast<std::string>(&value)) {
        return *s;
    }
    if (const auto* cs = std::any_cast<const char*>(&value)) {
        return std::string(*cs);
    }
    return std::nullopt;
}

} // namespace

Properties::Properties() = default;

Properties::Properties(const Properties& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = other.properties_;
}

Properties::Properties(Properties&& other) noexcept {
    std::unique_lock<std::shared_mutex> lock(other.mutex_);
    properties_ = std::move(other.properties_);
}

Properties& Properties::operator=(const Properties& other) {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = other.properties_;
    }
    return *this;
}

Properties& Properties::operator=(Properties&& other) noexcept {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::unique_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        properties_ = std::move(other.properties_);
    }
    return *this;
}

void Properties::set(const std::string& key, const std::any& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_[key] = value;
}

std::any Properties::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it != properties_.end()) {
        return it->second;
    }
    return std::any();
}

std::string Properties::getString(const std::string& key, const std::string& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }
    return asText(it->second).value_or(defaultValue);
}

int Properties::getInt(const std::string& key, int defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* v = std::any_cast<int>(&it->second)) {
        return *v;
    }
    if (const auto* v = std::any_cast<int64_t>(&it->second)) {
        return static_cast<int>(*v);
    }
    if (const auto* v = std::any_cast<double>(&it->second)) {
        return static_cast<int>(*v);
    }
    auto text = asText(it->second);
    if (!text) {
        return defaultValue;
    }
    try {
        return std::stoi(*text);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

int64_t Properties::getInt64(const std::string& key, int64_t defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* v = std::any_cast<int64_t>(&it->second)) {
        return *v;
    }
    if (const auto* v = std::any_cast<int>(&it->second)) {
        return *v;
    }
    auto text = asText(it->second);
    if (!text) {
        return defaultValue;
    }
    try {
        return std::stoll(*text);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

bool Properties::getBool(const std::string& key, bool defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* v = std::any_cast<bool>(&it->second)) {
        return *v;
    }
    auto text = asText(it->second);
    if (!text) {
        return defaultValue;
    }
    return *text == "true" || *text == "1" || *text == "yes" || *text == "on";
}

double Properties::getDouble(const std::string& key, double defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return defaultValue;
    }

    if (const auto* v = std::any_cast<double>(&it->second)) {
        return *v;
    }
    if (const auto* v = std::any_cast<float>(&it->second)) {
        return *v;
    }
    if (const auto* v = std::any_cast<int>(&it->second)) {
        return *v;
    }
    if (const auto* v = std::any_cast<int64_t>(&it->second)) {
        return static_cast<double>(*v);
    }
    auto text = asText(it->second);
    if (!text) {
        return defaultValue;
    }
    try {
        return std::stod(*text);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

std::vector<std::string> Properties::getStringList(const std::string& key) const {
    auto value = getAs<std::vector<std::string>>(key);
    return value.value_or(std::vector<std::string>{});
}

std::map<std::string, std::string> Properties::getStringMap(const std::string& key) const {
    auto value = getAs<std::map<std::string, std::string>>(key);
    return value.value_or(std::map<std::string, std::string>{});
}

bool Properties::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.find(key) != properties_.end();
}

bool Properties::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return properties_.erase(key) > 0;
}

std::vector<std::string> Properties::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(properties_.size());
    for (const auto& pair : properties_) {
        result.push_back(pair.first);
    }
    return result;
}

size_t Properties::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.size();
}

bool Properties::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return properties_.empty();
}

void Properties::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    properties_.clear();
}

void Properties::merge(const Properties& other) {
    if (this == &other) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
    std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
    std::lock(lock1, lock2);

    for (const auto& pair : other.properties_) {
        properties_[pair.first] = pair.second;
    }
}

} // namespace meshcore
