#ifndef MESHCORE_UTILS_LOG_H
#define MESHCORE_UTILS_LOG_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace meshcore {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DMESHCORE_LOG_LEVEL_DEFAULT=::meshcore::utils::LogLevel::INFO
#ifndef MESHCORE_LOG_LEVEL_DEFAULT
    #define MESHCORE_LOG_LEVEL_DEFAULT ::meshcore::utils::LogLevel::INFO
#endif

inline LogLevel& maxLogLevel() {
    static LogLevel level = MESHCORE_LOG_LEVEL_DEFAULT;
    return level;
}

inline std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

// Set the maximum log level at runtime
inline void setLogLevel(LogLevel level) {
    maxLogLevel() = level;
}

inline LogLevel getLogLevel() {
    return maxLogLevel();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as written in configuration files
 *
 * Accepts the names produced by logLevelToString() in any case, plus "WARN".
 * Unknown names yield @p fallback.
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "VERBOSE" || upper == "TRACE") return LogLevel::VERBOSE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            filename = p + 1;
        }
    }
    return filename;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < maxLogLevel()) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    // Lines from concurrent request handlers must not interleave
    std::lock_guard<std::mutex> lock(logMutex());
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        std::cerr << oss.str() << std::endl;
    } else {
        std::cout << oss.str() << std::endl;
    }
}

} // namespace utils
} // namespace meshcore

/**
 * @brief Log Level Filtering
 *
 * 1. Compile time (CMakeLists.txt):
 *    add_compile_definitions(MESHCORE_LOG_LEVEL_DEFAULT=::meshcore::utils::LogLevel::DEBUG)
 *
 * 2. Runtime, usually from the "logging.level" configuration key:
 *    meshcore::utils::setLogLevel(meshcore::utils::parseLogLevel("WARNING"));
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

#define LOGV(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::meshcore::utils::log(::meshcore::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Stream-style formatting
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // MESHCORE_UTILS_LOG_H
