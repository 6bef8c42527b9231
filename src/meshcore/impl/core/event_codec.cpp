#include "core/event_codec.h"
#include "utils/clock.h"
#include "utils/log.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <vector>

using json = nlohmann::json;

namespace meshcore {

namespace {

json encodeProperties(const Properties& props) {
    json result = json::object();

    for (const auto& key : props.keys()) {
        if (auto strVal = props.getAs<std::string>(key)) {
            result[key] = strVal.value();
        } else if (auto cstrVal = props.getAs<const char*>(key)) {
            result[key] = std::string(cstrVal.value() ? cstrVal.value() : "");
        } else if (auto intVal = props.getAs<int>(key)) {
            result[key] = intVal.value();
        } else if (auto longVal = props.getAs<int64_t>(key)) {
            result[key] = longVal.value();
        } else if (auto uintVal = props.getAs<uint32_t>(key)) {
            result[key] = uintVal.value();
        } else if (auto boolVal = props.getAs<bool>(key)) {
            result[key] = boolVal.value();
        } else if (auto doubleVal = props.getAs<double>(key)) {
            result[key] = doubleVal.value();
        } else if (auto listVal = props.getAs<std::vector<std::string>>(key)) {
            result[key] = listVal.value();
        } else if (auto mapVal = props.getAs<std::map<std::string, std::string>>(key)) {
            result[key] = mapVal.value();
        } else {
            LOGV_FMT("Dropping property '" << key << "' with unsupported type");
        }
    }

    return result;
}

Properties decodeProperties(const json& j) {
    Properties props;

    for (auto& [key, value] : j.items()) {
        if (value.is_string()) {
            props.set(key, value.get<std::string>());
        } else if (value.is_number_integer()) {
            int64_t number = value.get<int64_t>();
            if (number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max()) {
                props.set(key, static_cast<int>(number));
            } else {
                props.set(key, number);
            }
        } else if (value.is_number_float()) {
            props.set(key, value.get<double>());
        } else if (value.is_boolean()) {
            props.set(key, value.get<bool>());
        } else if (value.is_array()) {
            std::vector<std::string> arr;
            for (const auto& elem : value) {
                if (elem.is_string()) {
                    arr.push_back(elem.get<std::string>());
                }
            }
            props.set(key, arr);
        } else if (value.is_object()) {
            std::map<std::string, std::string> map;
            for (auto& [entryKey, entryValue] : value.items()) {
                if (entryValue.is_string()) {
                    map[entryKey] = entryValue.get<std::string>();
                }
            }
            props.set(key, map);
        }
    }

    return props;
}

} // anonymous namespace

std::string encodeEvent(const Event& event) {
    json j;
    j["topic"] = event.getTopic();
    j["origin"] = event.getOrigin();
    j["timestamp"] = utils::toEpochMillis(event.getTimestamp());
    j["properties"] = encodeProperties(event.getProperties());
    return j.dump();
}

std::optional<Event> decodeEvent(const std::string& payload) {
    try {
        json j = json::parse(payload);
        if (!j.is_object() || !j.contains("topic") || !j["topic"].is_string()) {
            LOGW("Ignoring event payload without a topic");
            return std::nullopt;
        }

        Properties props;
        if (j.contains("properties") && j["properties"].is_object()) {
            props = decodeProperties(j["properties"]);
        }

        Event::TimePoint timestamp = std::chrono::system_clock::now();
        if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
            timestamp = utils::fromEpochMillis(j["timestamp"].get<int64_t>());
        }

        return Event(j["topic"].get<std::string>(), j.value("origin", ""), props, timestamp);

    } catch (const json::exception& e) {
        LOGW_FMT("Failed to parse event payload: " << e.what());
        return std::nullopt;
    }
}

} // namespace meshcore
