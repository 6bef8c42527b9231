/**
 * @file http_transport.h
 * @brief Abstract HTTP transport used for service invocation
 */

#ifndef MESHCORE_CLIENT_HTTP_TRANSPORT_H
#define MESHCORE_CLIENT_HTTP_TRANSPORT_H

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace meshcore {

/**
 * @brief Outbound HTTP request
 */
struct HttpRequest {
    /** HTTP verb, e.g. "POST" */
    std::string method = "POST";

    /** "http" or "https" */
    std::string scheme = "http";

    std::string host;

    int port = 80;

    /** Request target including the leading slash */
    std::string target = "/";

    std::map<std::string, std::string> headers;

    std::string body;

    std::chrono::milliseconds connect_timeout{10000};

    std::chrono::milliseconds request_timeout{30000};

    std::string url() const {
        return scheme + "://" + host + ":" + std::to_string(port) + target;
    }
};

/**
 * @brief HTTP response as received
 */
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Transport error codes
 */
enum class TransportError {
    SUCCESS = 0,
    ENDPOINT_NOT_FOUND,
    CONNECTION_FAILED,
    CONNECTION_CLOSED,
    TIMEOUT,
    SEND_FAILED,
    RECV_FAILED,
    PROTOCOL_ERROR,
    UNKNOWN_ERROR
};

inline const char* to_string(TransportError error) {
    switch (error) {
        case TransportError::SUCCESS: return "SUCCESS";
        case TransportError::ENDPOINT_NOT_FOUND: return "ENDPOINT_NOT_FOUND";
        case TransportError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case TransportError::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case TransportError::TIMEOUT: return "TIMEOUT";
        case TransportError::SEND_FAILED: return "SEND_FAILED";
        case TransportError::RECV_FAILED: return "RECV_FAILED";
        case TransportError::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Result type for transport operations
 *
 * A received response of any status is a success at this level;
 * @c system_error carries the errno-style code of a failed exchange.
 */
template<typename T>
struct TransportResult {
    TransportError error = TransportError::SUCCESS;
    T value = T{};
    std::string error_message;
    int system_error = 0;

    bool success() const { return error == TransportError::SUCCESS; }
    explicit operator bool() const { return success(); }
};

/**
 * @brief Blocking HTTP exchange
 *
 * Implementations must be safe to call from several threads at once.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual TransportResult<HttpResponse> send(const HttpRequest& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<IHttpTransport>;

} // namespace meshcore

#endif // MESHCORE_CLIENT_HTTP_TRANSPORT_H
