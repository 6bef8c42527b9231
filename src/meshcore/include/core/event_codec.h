#ifndef MESHCORE_CORE_EVENT_CODEC_H
#define MESHCORE_CORE_EVENT_CODEC_H

#include "core/event.h"

#include <optional>
#include <string>

namespace meshcore {

/**
 * @brief JSON wire format of events crossing process boundaries
 *
 * @code
 * { "topic": "mesh.endpoint.registered", "origin": "...", "timestamp": 1700000000000,
 *   "properties": { "appId": "auth", "port": 8080, "serviceNames": ["users"] } }
 * @endcode
 *
 * Property values of type std::string, const char*, int, int64_t, uint32_t,
 * double, bool, std::vector<std::string> and std::map<std::string, std::string>
 * are encoded; other types are dropped.
 */
std::string encodeEvent(const Event& event);

/**
 * @brief Decode a payload produced by encodeEvent() or an external publisher
 *
 * A missing timestamp reads as the time of decoding.
 *
 * @return nullopt if the payload is not a JSON object with a string topic
 */
std::optional<Event> decodeEvent(const std::string& payload);

} // namespace meshcore

#endif // MESHCORE_CORE_EVENT_CODEC_H
