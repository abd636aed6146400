/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Host Normalizer - Collapse wildcard-DNS hosts to their stable base name
 *
 * Wildcard DNS services (nip.io, sslip.io, ...) resolve names that embed an IP
 * address, e.g. "shop.10.0.0.7.nip.io" or "shop.10-0-0-7.nip.io". Routes and
 * certificates are registered under the base name ("shop"), so lookups first
 * normalize the requested name.
 */

#ifndef WAYPOINT_ROUTING_HOST_NORMALIZER_HPP
#define WAYPOINT_ROUTING_HOST_NORMALIZER_HPP

#include <span>
#include <string>
#include <string_view>

namespace waypoint::routing {

/**
 * Strips an embedded-IP tail from a host; returns the host unchanged when the
 * tail is not present
 */
using StripFunction = std::string (*)(std::string_view host);

/**
 * One row of the normalization table
 */
struct NormalizationRule {
    std::string_view suffix;    // Host must end with this
    StripFunction strip;
};

/**
 * Remove a trailing ".<d>.<d>.<d>.<d>.<label>.<label>"
 * "api.192.168.1.20.nip.io" -> "api"
 */
std::string strip_dotted_ip(std::string_view host);

/**
 * Remove a trailing ".<d>-<d>-<d>-<d>.<label>.<label>"
 * "api.192-168-1-20.sslip.io" -> "api"
 */
std::string strip_dashed_ip(std::string_view host);

/**
 * The built-in rule table, in evaluation order
 */
std::span<const NormalizationRule> default_rules() noexcept;

/**
 * Normalize a host with the given rules
 *
 * Rules are tried in order; a rule applies when its suffix matches, and the
 * first applicable rule whose strip changes the host decides the result.
 * Hosts no rule changes are returned as-is. Never fails.
 */
std::string normalize_host(std::string_view host, std::span<const NormalizationRule> rules);

/**
 * Normalize a host with the built-in rules
 */
std::string normalize_host(std::string_view host);

} // namespace waypoint::routing

#endif // WAYPOINT_ROUTING_HOST_NORMALIZER_HPP
