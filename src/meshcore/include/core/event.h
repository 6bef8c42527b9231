#ifndef MESHCORE_CORE_EVENT_H
#define MESHCORE_CORE_EVENT_H

#include "utils/properties.h"

#include <chrono>
#include <string>

namespace meshcore {

/**
 * @brief A message travelling over the mesh message bus
 *
 * Events have:
 * - Topic: dotted channel name (e.g. "mesh.endpoint.registered")
 * - Origin: identifier of the publishing mesh process, so a process can
 *   recognise its own broadcasts
 * - Timestamp: creation time
 * - Properties: payload
 */
class Event {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit Event(const std::string& topic, const std::string& origin = "");

    Event(const std::string& topic, const std::string& origin, const Properties& properties);

    /**
     * @brief Rebuild an event received from another process
     */
    Event(const std::string& topic, const std::string& origin, const Properties& properties,
          const TimePoint& timestamp);

    Event(const Event& other) = default;
    Event(Event&& other) noexcept = default;
    Event& operator=(const Event& other) = default;
    Event& operator=(Event&& other) noexcept = default;

    const std::string& getTopic() const { return topic_; }

    const std::string& getOrigin() const { return origin_; }

    const TimePoint& getTimestamp() const { return timestamp_; }

    const Properties& getProperties() const { return properties_; }

    Properties& getProperties() { return properties_; }

    void setProperty(const std::string& key, const std::any& value);

    bool hasProperty(const std::string& key) const;

    std::string getPropertyString(const std::string& key,
                                  const std::string& defaultValue = "") const;

    int getPropertyInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Check if the topic matches a subscription pattern
     *
     * "*" matches everything, "mesh.endpoint.*" matches every topic with
     * that prefix, anything else must match exactly.
     */
    bool matchesTopic(const std::string& pattern) const;

    std::string toString() const;

private:
    std::string topic_;
    std::string origin_;
    TimePoint timestamp_;
    Properties properties_;
};

} // namespace meshcore

#endif // MESHCORE_CORE_EVENT_H
