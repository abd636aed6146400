/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Route Resolver - Longest-prefix route matching and backend pool resolution
 *
 * This is the resolve stage of request handling: every store round-trip a
 * request needs for routing happens here, and the outcome is captured in an
 * immutable RouteDecision. Backend selection later works from that record
 * alone.
 */

#ifndef WAYPOINT_ROUTING_ROUTE_RESOLVER_HPP
#define WAYPOINT_ROUTING_ROUTE_RESOLVER_HPP

#include "routing/host_normalizer.hpp"
#include "routing/route.hpp"
#include "store/store_client.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace waypoint::routing {

/**
 * Outcome of the resolve stage for one request
 */
struct RouteDecision {
    Route route;
    ResolvedPool pool;              // May be empty; the caller rejects empty pools
    std::string upstream_path;      // Request path after strip_path rewriting
};

/**
 * Completion of a route match; route is nullopt when nothing matches
 */
using RouteHandler = std::function<void(std::exception_ptr error, std::optional<Route> route)>;

/**
 * Completion of a pool read
 */
using PoolHandler = std::function<void(std::exception_ptr error, ResolvedPool pool)>;

/**
 * Completion of the resolve stage
 *
 * error is a store::StoreError when the store is unavailable; otherwise the
 * decision is nullopt if no enabled route matches.
 */
using DecisionHandler = std::function<void(std::exception_ptr error, std::optional<RouteDecision> decision)>;

/**
 * Route resolver
 *
 * Stateless apart from its normalization table; every call reads the store
 * afresh, so control-plane changes apply to the next request. Each stage
 * is one pipelined round-trip and the request continues from the store
 * client's completion, so a slow store never holds a worker thread.
 * The store client must stay alive until the handler runs.
 */
class RouteResolver {
public:
    explicit RouteResolver(std::span<const NormalizationRule> rules = default_rules());

    /**
     * Resolve host and path to a route and its health-filtered pool
     *
     * @param host Request host, lowercase and without port
     * @param path Request path without query string
     */
    void async_resolve(store::StoreClient& store, std::string host, std::string path,
                       DecisionHandler handler) const;

    /**
     * Find the enabled route with the longest prefix of path
     *
     * Candidates come from the normalized host's index, or the raw host's
     * index when the normalized one is empty. Both indexes are read in one
     * round-trip and the candidate documents in a second one. Candidates
     * are visited in lexical id order, so among equally long prefixes the
     * smallest id wins. Missing, malformed and disabled routes are skipped.
     */
    void async_match_route(store::StoreClient& store, std::string host, std::string path,
                           RouteHandler handler) const;

    /**
     * Read the route's upstream list, drop targets marked "unhealthy" and
     * expand each survivor by its weight
     */
    static void async_resolve_pool(store::StoreClient& store, std::string route_id, PoolHandler handler);

    /**
     * Apply strip_path to a request path
     *
     * Only prefixes of two or more characters are stripped; an empty
     * remainder becomes "/".
     */
    static std::string rewrite_path(const Route& route, std::string_view path);

private:
    std::span<const NormalizationRule> rules_;
};

} // namespace waypoint::routing

#endif // WAYPOINT_ROUTING_ROUTE_RESOLVER_HPP
