#include "client/beast_http_transport.h"
#include "utils/log.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include <cerrno>

namespace meshcore {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

TransportResult<HttpResponse> failure(TransportError error, int system_error, const std::string& message) {
    TransportResult<HttpResponse> result;
    result.error = error;
    result.system_error = system_error;
    result.error_message = message;
    return result;
}

int toErrno(const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return ETIMEDOUT;
    }
    if (ec == http::error::end_of_stream || ec == asio::error::eof ||
        ec == asio::error::connection_reset || ec == ssl::error::stream_truncated) {
        return ECONNRESET;
    }
    if (ec.category() == boost::system::system_category()) {
        return ec.value();
    }
    return EPROTO;
}

TransportResult<HttpResponse> streamFailure(TransportError stage, const beast::error_code& ec,
                                            const std::string& what) {
    int code = toErrno(ec);
    TransportError error = stage;
    if (code == ETIMEDOUT) {
        error = TransportError::TIMEOUT;
    } else if (code == ECONNRESET) {
        error = TransportError::CONNECTION_CLOSED;
    }
    return failure(error, code, what + ": " + ec.message());
}

/**
 * @brief Run one asynchronous operation on @p ioc to completion
 */
template<typename Initiator>
beast::error_code runOperation(asio::io_context& ioc, Initiator initiate) {
    beast::error_code result = asio::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

http::verb toVerb(const std::string& method) {
    http::verb verb = http::string_to_verb(method);
    return verb == http::verb::unknown ? http::verb::post : verb;
}

http::request<http::string_body> buildRequest(const HttpRequest& request) {
    http::request<http::string_body> req{toVerb(request.method), request.target, 11};
    req.set(http::field::host, request.host + ":" + std::to_string(request.port));
    req.set(http::field::user_agent, "meshcore/" BOOST_BEAST_VERSION_STRING);
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    if (!request.body.empty() || req.method() == http::verb::post || req.method() == http::verb::put) {
        req.body() = request.body;
        req.prepare_payload();
    }
    return req;
}

/**
 * @brief Write the request and read the response on a connected stream
 */
template<typename Stream>
TransportResult<HttpResponse> exchange(asio::io_context& ioc, Stream& stream,
                                       const http::request<http::string_body>& req,
                                       const HttpRequest& request) {
    beast::get_lowest_layer(stream).expires_after(request.request_timeout);

    beast::error_code ec = runOperation(ioc, [&](auto handler) {
        http::async_write(stream, req, handler);
    });
    if (ec) {
        return streamFailure(TransportError::SEND_FAILED, ec, "write to " + request.url());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = runOperation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, res, handler);
    });
    if (ec) {
        return streamFailure(TransportError::RECV_FAILED, ec, "read from " + request.url());
    }

    TransportResult<HttpResponse> result;
    result.value.status = static_cast<int>(res.result_int());
    for (const auto& field : res.base()) {
        result.value.headers[std::string(field.name_string())] = std::string(field.value());
    }
    result.value.body = std::move(res.body());
    return result;
}

} // anonymous namespace

BeastHttpTransport::BeastHttpTransport(bool verify_peer)
    : ssl_context_(ssl::context::tls_client) {
    if (verify_peer) {
        beast::error_code ec;
        ssl_context_.set_default_verify_paths(ec);
        if (ec) {
            LOGW_FMT("Could not load default certificate paths: " << ec.message());
        }
        ssl_context_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_context_.set_verify_mode(ssl::verify_none);
    }
}

TransportResult<HttpResponse> BeastHttpTransport::send(const HttpRequest& request) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);

    beast::error_code ec;
    auto endpoints = resolver.resolve(request.host, std::to_string(request.port), ec);
    if (ec) {
        return failure(TransportError::ENDPOINT_NOT_FOUND, EHOSTUNREACH,
                       "resolve " + request.host + ": " + ec.message());
    }

    auto req = buildRequest(request);

    if (request.scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);

        if (!SSL_set_tlsext_host_name(stream.native_handle(), request.host.c_str())) {
            beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
            return failure(TransportError::CONNECTION_FAILED, EPROTO, "set SNI: " + sni_ec.message());
        }
        stream.set_verify_callback(ssl::host_name_verification(request.host));

        beast::get_lowest_layer(stream).expires_after(request.connect_timeout);
        ec = runOperation(ioc, [&](auto handler) {
            beast::get_lowest_layer(stream).async_connect(endpoints, handler);
        });
        if (ec) {
            return streamFailure(TransportError::CONNECTION_FAILED, ec, "connect to " + request.url());
        }

        ec = runOperation(ioc, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, handler);
        });
        if (ec) {
            return streamFailure(TransportError::CONNECTION_FAILED, ec, "TLS handshake with " + request.url());
        }

        auto result = exchange(ioc, stream, req, request);

        beast::get_lowest_layer(stream).expires_after(request.connect_timeout);
        ec = runOperation(ioc, [&](auto handler) {
            stream.async_shutdown(handler);
        });
        if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
            LOGD_FMT("TLS shutdown with " << request.host << " failed: " << ec.message());
        }
        return result;
    }

    beast::tcp_stream stream(ioc);
    stream.expires_after(request.connect_timeout);
    ec = runOperation(ioc, [&](auto handler) {
        stream.async_connect(endpoints, handler);
    });
    if (ec) {
        return streamFailure(TransportError::CONNECTION_FAILED, ec, "connect to " + request.url());
    }

    auto result = exchange(ioc, stream, req, request);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        LOGD_FMT("Socket shutdown with " << request.host << " failed: " << ec.message());
    }
    return result;
}

} // namespace meshcore
