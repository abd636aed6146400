/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * HTTP Message - Request and response views exchanged between sessions and handlers
 */

#ifndef WAYPOINT_SERVER_HTTP_MESSAGE_HPP
#define WAYPOINT_SERVER_HTTP_MESSAGE_HPP

#include <boost/beast/http.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waypoint::server {

namespace beast = boost::beast;
namespace http = beast::http;

/**
 * Parsed HTTP request information
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string method_string;
    std::string target;         // Path plus query as received
    std::string path;           // Target up to '?'
    std::string query;          // Target after '?', without the '?'
    unsigned version{11};       // HTTP/1.1 = 11

    std::string host;           // Lowercase, without port
    std::string x_request_id;

    // Client connection info
    std::string client_ip;
    std::uint16_t client_port{0};
    std::uint64_t connection_id{0};     // Engine-wide accept sequence number
    std::uint32_t worker_id{0};         // Worker thread handling the request
    bool secure{false};
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};   // Omitted when empty
    std::string body;

    // Additional headers (optional)
    std::vector<std::pair<std::string, std::string>> headers{};
};

/**
 * Delivers the response for one request; may be called from any thread
 */
using ResponseCallback = std::function<void(HttpResponse)>;

/**
 * Request handler callback type
 * The handler must call the callback exactly once, now or later.
 */
using RequestHandler = std::function<void(const HttpRequest&, ResponseCallback)>;

/**
 * Reduce a Host header value to a lowercase host name without port
 * "API.Example.com:8443" -> "api.example.com", "[::1]:80" -> "[::1]"
 */
std::string normalize_host_header(std::string_view value);

/**
 * Split a request target into path and query
 */
std::pair<std::string, std::string> split_target(std::string_view target);

} // namespace waypoint::server

#endif // WAYPOINT_SERVER_HTTP_MESSAGE_HPP
