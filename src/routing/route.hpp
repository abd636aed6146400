/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Route Model - Routes, backend targets and resolved pools as read from the store
 */

#ifndef WAYPOINT_ROUTING_ROUTE_HPP
#define WAYPOINT_ROUTING_ROUTE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::routing {

/**
 * Largest weight honored for a single target; larger values are clamped
 */
constexpr std::uint32_t kMaxTargetWeight = 1000;

/**
 * One backend instance of a route's pool
 */
struct BackendTarget {
    std::string address;
    std::uint16_t port{0};
    std::uint32_t weight{1};

    bool operator==(const BackendTarget&) const = default;

    /**
     * "address:port"
     */
    std::string to_string() const;
};

/**
 * Healthy targets, each repeated `weight` times, in store order
 */
using ResolvedPool = std::vector<BackendTarget>;

/**
 * A host+path routing rule
 */
struct Route {
    std::string id;                         // Also keys the route's upstream list
    std::string host;
    std::string path{"/"};                  // Prefix matched against the request path
    bool enabled{true};
    bool strip_path{false};
    bool preserve_host{true};
    std::string protocol{"http"};
    std::string load_balancer{"round_robin"};
};

/**
 * Parse a route document
 *
 * Missing or null fields take their defaults; an empty path means "/".
 * @param id The id the route was indexed under
 * @return nullopt if the document is not valid JSON or a field has the wrong type
 */
std::optional<Route> parse_route(std::string_view id, std::string_view document);

/**
 * Parse an upstream entry "address:port[:weight]"
 *
 * A missing, non-numeric or non-positive weight is 1.
 * @return nullopt if the address or a valid port is missing
 */
std::optional<BackendTarget> parse_target(std::string_view entry);

void from_json(const nlohmann::json& j, Route& r);

} // namespace waypoint::routing

#endif // WAYPOINT_ROUTING_ROUTE_HPP
