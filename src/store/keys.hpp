/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Store Keys - Key schema shared with the control plane
 */

#ifndef WAYPOINT_STORE_KEYS_HPP
#define WAYPOINT_STORE_KEYS_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace waypoint::store::keys {

// Set of route ids registered for a host
inline std::string route_index(std::string_view host) {
    return "routes:index:host:" + std::string(host);
}

// Route JSON document
inline std::string route(std::string_view route_id) {
    return "routes:" + std::string(route_id);
}

// Ordered list of "address:port[:weight]"
inline std::string upstreams(std::string_view route_id) {
    return "upstreams:" + std::string(route_id);
}

// "unhealthy" marker, absent when healthy
inline std::string upstream_health(std::string_view route_id, std::string_view address, std::uint16_t port) {
    return "upstreams:health:" + std::string(route_id) + ":" + std::string(address) + ":" + std::to_string(port);
}

// Certificate JSON document
inline std::string certificate(std::string_view domain) {
    return "certs:" + std::string(domain);
}

// ACME HTTP-01 key authorization
inline std::string acme_challenge(std::string_view token) {
    return "acme:challenge:" + std::string(token);
}

} // namespace waypoint::store::keys

#endif // WAYPOINT_STORE_KEYS_HPP
