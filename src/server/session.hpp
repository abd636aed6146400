/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Session - HTTP/1.1 request handling over plain TCP and TLS with Boost.Beast
 *
 * HttpSession holds the read/handle/write loop once for both transports; the
 * derived classes only supply the stream, the TLS handshake and the shutdown.
 */

#ifndef WAYPOINT_SERVER_SESSION_HPP
#define WAYPOINT_SERVER_SESSION_HPP

#include "server/http_message.hpp"
#include "server/tls_context.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

namespace waypoint::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

/**
 * Read/write deadline for a single request or response
 */
constexpr std::chrono::seconds kRequestTimeout{30};

/**
 * Deadline for the TLS handshake
 */
constexpr std::chrono::seconds kHandshakeTimeout{10};

/**
 * Per-connection information captured at accept time
 */
struct ConnectionInfo {
    std::uint64_t connection_id{0};
    std::string client_ip;
    std::uint16_t client_port{0};
};

/**
 * Build a handler-facing request from a parsed Beast request
 */
HttpRequest make_request(const http::request<http::string_body>& req,
                         const ConnectionInfo& info, bool secure);

/**
 * Build a Beast response from a handler response
 */
http::response<http::string_body> make_response(const HttpResponse& resp, unsigned version);

/**
 * JSON error response used for transport-level failures
 */
http::response<http::string_body> make_error_response(http::status status,
                                                      const std::string& message,
                                                      unsigned version);

/**
 * Whether a read error means the client sent something unparseable
 */
bool is_malformed_request(beast::error_code ec) noexcept;

/**
 * Capture remote endpoint details of an accepted socket
 */
ConnectionInfo describe_connection(const tcp::socket& socket, std::uint64_t connection_id);

void log_transport_error(beast::error_code ec, const char* what, const ConnectionInfo& info);
void log_handler_error(const std::exception& e, const ConnectionInfo& info);

/**
 * Id of the worker thread running the caller, 0 outside the worker pool
 */
std::uint32_t current_worker_id() noexcept;

/**
 * Assign the calling thread's worker id (done once per worker by Server)
 */
void set_current_worker_id(std::uint32_t worker_id) noexcept;

/**
 * Shared HTTP/1.1 loop (CRTP)
 *
 * Derived must provide stream(), do_eof() and be owned by a shared_ptr.
 */
template<class Derived>
class HttpSession {
public:
    HttpSession(RequestHandler handler, ConnectionInfo info)
        : handler_(std::move(handler))
        , info_(std::move(info)) {
    }

protected:
    Derived& derived() {
        return static_cast<Derived&>(*this);
    }

    void do_read() {
        // Clear the request for the next read
        request_ = {};

        beast::get_lowest_layer(derived().stream()).expires_after(kRequestTimeout);

        http::async_read(
            derived().stream(),
            buffer_,
            request_,
            beast::bind_front_handler(&HttpSession::on_read, derived().shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        // Client closed connection
        if (ec == http::error::end_of_stream) {
            derived().do_eof();
            return;
        }

        if (ec) {
            if (is_malformed_request(ec)) {
                keep_alive_ = false;
                response_ = make_error_response(http::status::bad_request,
                                                "Malformed HTTP request: " + ec.message(), 11);
                do_write();
                return;
            }
            if (ec != asio::error::operation_aborted && ec != beast::error::timeout) {
                on_transport_error(ec, "read");
            }
            derived().do_eof();
            return;
        }

        // Require HTTP/1.0 or HTTP/1.1
        if (request_.version() != 10 && request_.version() != 11) {
            keep_alive_ = false;
            response_ = make_error_response(http::status::http_version_not_supported,
                                            "Only HTTP/1.0 and HTTP/1.1 are supported", 11);
            do_write();
            return;
        }

        keep_alive_ = request_.keep_alive();
        auto version = request_.version();

        // The handler continues off this thread when it waits on the store;
        // the response comes back to this connection's strand
        try {
            auto parsed = make_request(request_, info_, Derived::secure);
            auto self = derived().shared_from_this();
            handler_(parsed, [self, version](HttpResponse response) {
                auto executor = beast::get_lowest_layer(self->stream()).get_executor();
                asio::dispatch(
                    executor,
                    beast::bind_front_handler(&HttpSession::on_handled, self, std::move(response), version)
                );
            });
        } catch (const std::exception& e) {
            on_handler_error(e);
            response_ = make_error_response(http::status::internal_server_error,
                                            "Internal server error", version);
            do_write();
        }
    }

    void on_handled(HttpResponse response, unsigned version) {
        try {
            response_ = make_response(response, version);
        } catch (const std::exception& e) {
            on_handler_error(e);
            response_ = make_error_response(http::status::internal_server_error,
                                            "Internal server error", version);
        }

        do_write();
    }

    void do_write() {
        response_.keep_alive(keep_alive_);
        response_.prepare_payload();

        beast::get_lowest_layer(derived().stream()).expires_after(kRequestTimeout);

        http::async_write(
            derived().stream(),
            response_,
            beast::bind_front_handler(&HttpSession::on_write, derived().shared_from_this())
        );
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec) {
            if (ec != asio::error::operation_aborted) {
                on_transport_error(ec, "write");
            }
            derived().do_eof();
            return;
        }

        if (!keep_alive_) {
            derived().do_eof();
            return;
        }

        response_ = {};
        do_read();
    }

    void on_transport_error(beast::error_code ec, const char* what) const {
        log_transport_error(ec, what, info_);
    }

    void on_handler_error(const std::exception& e) const {
        log_handler_error(e, info_);
    }

    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    RequestHandler handler_;
    ConnectionInfo info_;
    bool keep_alive_{false};
};

/**
 * Plain HTTP connection
 */
class PlainSession : public HttpSession<PlainSession>,
                     public std::enable_shared_from_this<PlainSession> {
public:
    static constexpr bool secure = false;

    PlainSession(tcp::socket socket, RequestHandler handler, ConnectionInfo info);

    // Non-copyable, non-movable
    PlainSession(const PlainSession&) = delete;
    PlainSession& operator=(const PlainSession&) = delete;

    /**
     * Start processing the connection asynchronously
     */
    void start();

    beast::tcp_stream& stream() { return stream_; }

    void do_eof();

private:
    beast::tcp_stream stream_;
};

/**
 * TLS connection
 *
 * The ClientHello is read into a buffer first. Its SNI name goes to the
 * context's resolver, the chosen certificate is installed on the connection
 * and the handshake then runs over the buffered bytes.
 */
class TlsSession : public HttpSession<TlsSession>,
                   public std::enable_shared_from_this<TlsSession> {
public:
    static constexpr bool secure = true;

    TlsSession(tcp::socket socket, TlsContextManager& tls, RequestHandler handler, ConnectionInfo info);

    // Non-copyable, non-movable
    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    /**
     * Start with the TLS handshake, then serve requests
     */
    void start();

    ssl::stream<beast::tcp_stream>& stream() { return stream_; }

    void do_eof();

private:
    void do_read_hello();
    void on_read_hello(beast::error_code ec, std::size_t bytes_transferred);
    void on_certificate(const CertificateInstaller& installer, const std::string& server_name);
    void do_handshake();
    void on_handshake(beast::error_code ec, std::size_t bytes_used);
    void on_shutdown(beast::error_code ec);

    ssl::stream<beast::tcp_stream> stream_;
    TlsContextManager& tls_;
    beast::flat_buffer hello_buffer_;
};

} // namespace waypoint::server

#endif // WAYPOINT_SERVER_SESSION_HPP
