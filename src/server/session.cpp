/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Session implementation - HTTP/1.1 over plain TCP and TLS
 */

#include "server/session.hpp"
#include "server/client_hello.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <tuple>

namespace waypoint::server {

using util::log_component::TLS;

namespace {

constexpr const char* kServerHeader = "Waypoint/0.1.0";

std::string_view to_std(beast::string_view value) {
    return std::string_view(value.data(), value.size());
}

constexpr auto kComponent = util::log_component::Server;

thread_local std::uint32_t tls_worker_id = 0;

} // anonymous namespace

std::uint32_t current_worker_id() noexcept {
    return tls_worker_id;
}

void set_current_worker_id(std::uint32_t worker_id) noexcept {
    tls_worker_id = worker_id;
}

HttpRequest make_request(const http::request<http::string_body>& req,
                         const ConnectionInfo& info, bool secure) {
    HttpRequest parsed;

    parsed.method = req.method();
    parsed.method_string = std::string(req.method_string());
    parsed.target = std::string(req.target());
    parsed.version = req.version();
    std::tie(parsed.path, parsed.query) = split_target(parsed.target);

    if (auto it = req.find(http::field::host); it != req.end()) {
        parsed.host = normalize_host_header(to_std(it->value()));
    }
    // X-Request-ID is a custom header, search by name
    if (auto it = req.find("X-Request-ID"); it != req.end()) {
        parsed.x_request_id = std::string(it->value());
    }

    parsed.client_ip = info.client_ip;
    parsed.client_port = info.client_port;
    parsed.connection_id = info.connection_id;
    parsed.worker_id = current_worker_id();
    parsed.secure = secure;

    return parsed;
}

http::response<http::string_body> make_response(const HttpResponse& resp, unsigned version) {
    http::response<http::string_body> response{resp.status, version};

    response.set(http::field::server, kServerHeader);
    if (!resp.content_type.empty()) {
        response.set(http::field::content_type, resp.content_type);
    }

    for (const auto& [name, value] : resp.headers) {
        response.set(name, value);
    }

    response.body() = resp.body;
    return response;
}

http::response<http::string_body> make_error_response(http::status status,
                                                      const std::string& message,
                                                      unsigned version) {
    http::response<http::string_body> response{status, version};

    response.set(http::field::server, kServerHeader);
    response.set(http::field::content_type, "application/json");
    response.body() = nlohmann::json{{"error", message}}.dump();

    return response;
}

bool is_malformed_request(beast::error_code ec) noexcept {
    return ec == http::error::bad_method ||
           ec == http::error::bad_target ||
           ec == http::error::bad_version ||
           ec == http::error::bad_field ||
           ec == http::error::bad_value ||
           ec == http::error::bad_content_length ||
           ec == http::error::bad_transfer_encoding ||
           ec == http::error::bad_chunk ||
           ec == http::error::header_limit ||
           ec == http::error::body_limit;
}

ConnectionInfo describe_connection(const tcp::socket& socket, std::uint64_t connection_id) {
    ConnectionInfo info;
    info.connection_id = connection_id;

    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (!ec) {
        info.client_ip = endpoint.address().to_string();
        info.client_port = endpoint.port();
    }
    return info;
}

void log_transport_error(beast::error_code ec, const char* what, const ConnectionInfo& info) {
    WAYPOINT_LOG_DEBUG(kComponent, "Connection #{} from {}: {} error - {}",
                       info.connection_id,
                       info.client_ip.empty() ? "(unknown)" : info.client_ip,
                       what, ec.message());
}

void log_handler_error(const std::exception& e, const ConnectionInfo& info) {
    WAYPOINT_LOG_ERROR(kComponent, "Connection #{}: handler exception - {}", info.connection_id, e.what());
}

// PlainSession

PlainSession::PlainSession(tcp::socket socket, RequestHandler handler, ConnectionInfo info)
    : HttpSession<PlainSession>(std::move(handler), std::move(info))
    , stream_(std::move(socket)) {
}

void PlainSession::start() {
    // Run the session on the socket's executor
    asio::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&PlainSession::do_read, shared_from_this())
    );
}

void PlainSession::do_eof() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // Socket may already be closed by the peer
}

// TlsSession

TlsSession::TlsSession(tcp::socket socket, TlsContextManager& tls, RequestHandler handler, ConnectionInfo info)
    : HttpSession<TlsSession>(std::move(handler), std::move(info))
    , stream_(beast::tcp_stream(std::move(socket)), tls.get_context())
    , tls_(tls) {
}

void TlsSession::start() {
    asio::dispatch(
        beast::get_lowest_layer(stream_).get_executor(),
        beast::bind_front_handler(&TlsSession::do_read_hello, shared_from_this())
    );
}

void TlsSession::do_read_hello() {
    auto& lowest = beast::get_lowest_layer(stream_);
    lowest.expires_after(kHandshakeTimeout);
    lowest.async_read_some(
        hello_buffer_.prepare(4096),
        beast::bind_front_handler(&TlsSession::on_read_hello, shared_from_this())
    );
}

void TlsSession::on_read_hello(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (ec != asio::error::operation_aborted) {
            on_transport_error(ec, "handshake read");
        }
        return;
    }
    hello_buffer_.commit(bytes_transferred);

    auto data = hello_buffer_.data();
    auto hello = inspect_client_hello(std::string_view(static_cast<const char*>(data.data()), data.size()));

    if (hello.status == ClientHelloStatus::incomplete) {
        do_read_hello();
        return;
    }

    const auto& resolver = tls_.sni_resolver();
    if (hello.status == ClientHelloStatus::invalid || hello.server_name.empty() || !resolver) {
        // No name to look up; OpenSSL uses the default certificate or rejects the bytes
        do_handshake();
        return;
    }

    auto self = shared_from_this();
    auto server_name = hello.server_name;
    resolver(std::move(hello.server_name), [self, server_name](CertificateInstaller installer) {
        asio::dispatch(
            beast::get_lowest_layer(self->stream_).get_executor(),
            [self, server_name, installer = std::move(installer)]() {
                self->on_certificate(installer, server_name);
            }
        );
    });
}

void TlsSession::on_certificate(const CertificateInstaller& installer, const std::string& server_name) {
    if (!installer || !installer(stream_.native_handle())) {
        WAYPOINT_LOG_DEBUG(TLS, "SNI {}: no stored certificate installed, using default", server_name);
    }
    do_handshake();
}

void TlsSession::do_handshake() {
    beast::get_lowest_layer(stream_).expires_after(kHandshakeTimeout);
    stream_.async_handshake(
        ssl::stream_base::server,
        hello_buffer_.data(),
        beast::bind_front_handler(&TlsSession::on_handshake, shared_from_this())
    );
}

void TlsSession::on_handshake(beast::error_code ec, std::size_t bytes_used) {
    boost::ignore_unused(bytes_used);
    const auto& client = info_.client_ip.empty() ? std::string("(unknown)") : info_.client_ip;

    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec.category() == asio::error::get_ssl_category()) {
            WAYPOINT_LOG_WARN(TLS, "Handshake failed from {}:{} - {}", client, info_.client_port, ec.message());
        } else {
            WAYPOINT_LOG_DEBUG(TLS, "Handshake error from {}:{} - {}", client, info_.client_port, ec.message());
        }
        return;
    }

    WAYPOINT_LOG_DEBUG(TLS, "Handshake complete from {}:{}", client, info_.client_port);
    do_read();
}

void TlsSession::do_eof() {
    beast::get_lowest_layer(stream_).expires_after(kHandshakeTimeout);
    stream_.async_shutdown(
        beast::bind_front_handler(&TlsSession::on_shutdown, shared_from_this())
    );
}

void TlsSession::on_shutdown(beast::error_code ec) {
    // Peers commonly close without close_notify
    if (ec && ec != asio::ssl::error::stream_truncated && ec != asio::error::eof) {
        WAYPOINT_LOG_DEBUG(TLS, "Connection #{}: shutdown error - {}", info_.connection_id, ec.message());
    }
}

} // namespace waypoint::server
