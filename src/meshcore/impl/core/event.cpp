#include "core/event.h"

#include <sstream>

namespace meshcore {

Event::Event(const std::string& topic, const std::string& origin)
    : topic_(topic)
    , origin_(origin)
    , timestamp_(std::chrono::system_clock::now())
    , properties_() {
}

Event::Event(const std::string& topic, const std::string& origin, const Properties& properties)
    : topic_(topic)
    , origin_(origin)
    , timestamp_(std::chrono::system_clock::now())
    , properties_(properties) {
}

Event::Event(const std::string& topic, const std::string& origin, const Properties& properties,
             const TimePoint& timestamp)
    : topic_(topic)
    , origin_(origin)
    , timestamp_(timestamp)
    , properties_(properties) {
}

void Event::setProperty(const std::string& key, const std::any& value) {
    properties_.set(key, value);
}

bool Event::hasProperty(const std::string& key) const {
    return properties_.has(key);
}

std::string Event::getPropertyString(const std::string& key,
                                     const std::string& defaultValue) const {
    return properties_.getString(key, defaultValue);
}

int Event::getPropertyInt(const std::string& key, int defaultValue) const {
    return properties_.getInt(key, defaultValue);
}

bool Event::matchesTopic(const std::string& pattern) const {
    if (pattern.empty() || pattern == "*") {
        return true;
    }

    size_t starPos = pattern.find('*');
    if (starPos == std::string::npos) {
        return topic_ == pattern;
    }

    // Only trailing wildcards are supported
    if (starPos == pattern.length() - 1) {
        return topic_.compare(0, starPos, pattern, 0, starPos) == 0;
    }
    return false;
}

std::string Event::toString() const {
    std::ostringstream oss;
    oss << "Event{topic='" << topic_ << "'";
    if (!origin_.empty()) {
        oss << ", origin='" << origin_ << "'";
    }
    oss << ", properties=[";
    auto keys = properties_.keys();
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << keys[i];
    }
    oss << "]}";
    return oss.str();
}

} // namespace meshcore
