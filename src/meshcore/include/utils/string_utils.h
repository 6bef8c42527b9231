#ifndef MESHCORE_UTILS_STRING_UTILS_H
#define MESHCORE_UTILS_STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>

namespace meshcore {
namespace utils {

inline std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Case-insensitive prefix test used by the admin listing filters
 */
inline bool startsWithIgnoreCase(const std::string& value, const std::string& prefix) {
    if (prefix.size() > value.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
}

} // namespace utils
} // namespace meshcore

#endif // MESHCORE_UTILS_STRING_UTILS_H
