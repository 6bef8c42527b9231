#ifndef MESHCORE_CLIENT_BEAST_HTTP_TRANSPORT_H
#define MESHCORE_CLIENT_BEAST_HTTP_TRANSPORT_H

#include "client/http_transport.h"

#include <boost/asio/ssl/context.hpp>

namespace meshcore {

/**
 * @brief HTTP/1.1 transport on Boost.Beast
 *
 * Each call opens its own connection on a private io_context and runs the
 * asynchronous operations to completion, so the stream timeouts apply to
 * connect, TLS handshake, write and read. "https" requests go through TLS
 * with SNI set to the request host.
 *
 * Failures are reported with an errno-style code:
 * - resolve failure: EHOSTUNREACH
 * - timeout: ETIMEDOUT
 * - peer closed the stream: ECONNRESET
 * - socket errors: their system error value
 */
class BeastHttpTransport : public IHttpTransport {
public:
    /**
     * @param verify_peer Verify server certificates against the system store
     */
    explicit BeastHttpTransport(bool verify_peer = true);

    TransportResult<HttpResponse> send(const HttpRequest& request) override;

private:
    boost::asio::ssl::context ssl_context_;
};

} // namespace meshcore

#endif // MESHCORE_CLIENT_BEAST_HTTP_TRANSPORT_H
