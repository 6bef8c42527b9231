#ifndef MESHCORE_CORE_MESH_ERROR_H
#define MESHCORE_CORE_MESH_ERROR_H

#include <stdexcept>
#include <string>

namespace meshcore {

/**
 * @brief Failure classes surfaced by registry, routing and invocation
 */
enum class MeshErrorCode {
    /**
     * @brief Unknown appId, instanceId or service name
     */
    NOT_FOUND,

    /**
     * @brief The backing state store cannot be reached
     * Surfaced immediately, never retried.
     */
    DEPENDENCY_UNAVAILABLE,

    /**
     * @brief Fast-fail because the breaker for the target appId is open
     */
    CIRCUIT_OPEN,

    /**
     * @brief Retryable transport failure (connection refused, reset, timeout)
     * Raised to the caller only after retries are exhausted.
     */
    TRANSIENT_UPSTREAM,

    /**
     * @brief Non-retryable upstream failure
     * Persistent 408/429/5xx after retries, or a non-success status on a
     * typed call.
     */
    TERMINAL_UPSTREAM,

    /**
     * @brief Malformed request (empty appId, bad port)
     */
    INVALID_ARGUMENT
};

inline const char* to_string(MeshErrorCode code) {
    switch (code) {
        case MeshErrorCode::NOT_FOUND: return "NOT_FOUND";
        case MeshErrorCode::DEPENDENCY_UNAVAILABLE: return "DEPENDENCY_UNAVAILABLE";
        case MeshErrorCode::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case MeshErrorCode::TRANSIENT_UPSTREAM: return "TRANSIENT_UPSTREAM";
        case MeshErrorCode::TERMINAL_UPSTREAM: return "TERMINAL_UPSTREAM";
        case MeshErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Exception carrying a MeshErrorCode
 *
 * Upstream failures also carry the last HTTP status seen (0 when the
 * failure happened below HTTP).
 */
class MeshException : public std::runtime_error {
public:
    MeshException(MeshErrorCode code, const std::string& message, int httpStatus = 0)
        : std::runtime_error(std::string(to_string(code)) + ": " + message)
        , code_(code)
        , httpStatus_(httpStatus) {
    }

    MeshErrorCode code() const noexcept { return code_; }

    int httpStatus() const noexcept { return httpStatus_; }

private:
    MeshErrorCode code_;
    int httpStatus_;
};

} // namespace meshcore

#endif // MESHCORE_CORE_MESH_ERROR_H
