/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Route Resolver Implementation
 */

#include "routing/route_resolver.hpp"
#include "store/keys.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace waypoint::routing {

using util::log_component::Router;

namespace {

constexpr std::string_view kUnhealthyMarker = "unhealthy";

// Longest enabled prefix of path among the fetched route documents
std::optional<Route> select_route(const std::vector<std::string>& route_ids,
                                  const std::vector<store::resp::Value>& documents,
                                  std::string_view path) {
    std::optional<Route> selected;
    std::size_t longest = 0;

    for (std::size_t i = 0; i < route_ids.size(); ++i) {
        const auto& route_id = route_ids[i];
        auto document = store::resp::as_string(documents[i], "GET");
        if (!document) {
            WAYPOINT_LOG_DEBUG(Router, "Route {} indexed but missing, skipping", route_id);
            continue;
        }

        auto route = parse_route(route_id, *document);
        if (!route) {
            WAYPOINT_LOG_WARN(Router, "Route {} has a malformed document, skipping", route_id);
            continue;
        }
        if (!route->enabled) {
            continue;
        }

        const auto& prefix = route->path;
        if (path.starts_with(prefix) && prefix.size() > longest) {
            longest = prefix.size();
            selected = std::move(route);
        }
    }

    return selected;
}

} // anonymous namespace

RouteResolver::RouteResolver(std::span<const NormalizationRule> rules)
    : rules_(rules) {
}

void RouteResolver::async_resolve(store::StoreClient& store, std::string host, std::string path,
                                  DecisionHandler handler) const {
    async_match_route(store, host, path,
        [&store, host, path, handler = std::move(handler)](
            std::exception_ptr error, std::optional<Route> route) mutable {
            if (error || !route) {
                handler(error, std::nullopt);
                return;
            }

            auto route_id = route->id;
            async_resolve_pool(store, std::move(route_id),
                [host = std::move(host), path = std::move(path), route = std::move(*route),
                 handler = std::move(handler)](std::exception_ptr pool_error, ResolvedPool pool) mutable {
                    if (pool_error) {
                        handler(pool_error, std::nullopt);
                        return;
                    }

                    RouteDecision decision;
                    decision.pool = std::move(pool);
                    decision.upstream_path = rewrite_path(route, path);
                    decision.route = std::move(route);

                    WAYPOINT_LOG_DEBUG(Router, "{}{} -> route {} (prefix={}, pool={}, upstream_path={})",
                                       host, path, decision.route.id, decision.route.path,
                                       decision.pool.size(), decision.upstream_path);
                    handler(nullptr, std::move(decision));
                });
        });
}

void RouteResolver::async_match_route(store::StoreClient& store, std::string host, std::string path,
                                      RouteHandler handler) const {
    std::string normalized = normalize_host(host, rules_);

    std::vector<store::Command> lookups;
    lookups.push_back({"SMEMBERS", store::keys::route_index(normalized)});
    if (normalized != host) {
        lookups.push_back({"SMEMBERS", store::keys::route_index(host)});
    }

    store.async_execute(std::move(lookups),
        [&store, host = std::move(host), normalized, path = std::move(path), handler = std::move(handler)](
            std::exception_ptr error, std::vector<store::resp::Value> replies) mutable {
            std::vector<std::string> route_ids;
            if (!error) {
                try {
                    route_ids = store::resp::as_string_list(replies[0], "SMEMBERS");
                    if (route_ids.empty() && replies.size() > 1) {
                        route_ids = store::resp::as_string_list(replies[1], "SMEMBERS");
                    }
                } catch (const store::StoreError&) {
                    error = std::current_exception();
                }
            }
            if (error) {
                handler(error, std::nullopt);
                return;
            }
            if (route_ids.empty()) {
                WAYPOINT_LOG_DEBUG(Router, "No routes indexed for host {} (normalized {})", host, normalized);
                handler(nullptr, std::nullopt);
                return;
            }

            std::sort(route_ids.begin(), route_ids.end());

            std::vector<store::Command> documents;
            documents.reserve(route_ids.size());
            for (const auto& route_id : route_ids) {
                documents.push_back({"GET", store::keys::route(route_id)});
            }

            store.async_execute(std::move(documents),
                [route_ids = std::move(route_ids), path = std::move(path), handler = std::move(handler)](
                    std::exception_ptr documents_error, std::vector<store::resp::Value> replies) mutable {
                    std::optional<Route> selected;
                    if (!documents_error) {
                        try {
                            selected = select_route(route_ids, replies, path);
                        } catch (const store::StoreError&) {
                            documents_error = std::current_exception();
                        }
                    }
                    if (documents_error) {
                        handler(documents_error, std::nullopt);
                        return;
                    }
                    handler(nullptr, std::move(selected));
                });
        });
}

void RouteResolver::async_resolve_pool(store::StoreClient& store, std::string route_id, PoolHandler handler) {
    std::vector<store::Command> list;
    list.push_back({"LRANGE", store::keys::upstreams(route_id), "0", "-1"});

    store.async_execute(std::move(list),
        [&store, route_id = std::move(route_id), handler = std::move(handler)](
            std::exception_ptr error, std::vector<store::resp::Value> replies) mutable {
            std::vector<BackendTarget> targets;
            if (!error) {
                try {
                    for (const auto& entry : store::resp::as_string_list(replies[0], "LRANGE")) {
                        auto target = parse_target(entry);
                        if (!target) {
                            WAYPOINT_LOG_WARN(Router, "Route {}: ignoring malformed upstream '{}'", route_id, entry);
                            continue;
                        }
                        targets.push_back(std::move(*target));
                    }
                } catch (const store::StoreError&) {
                    error = std::current_exception();
                }
            }
            if (error) {
                handler(error, ResolvedPool{});
                return;
            }
            if (targets.empty()) {
                handler(nullptr, ResolvedPool{});
                return;
            }

            std::vector<store::Command> health_checks;
            health_checks.reserve(targets.size());
            for (const auto& target : targets) {
                health_checks.push_back({"GET", store::keys::upstream_health(route_id, target.address, target.port)});
            }

            store.async_execute(std::move(health_checks),
                [route_id = std::move(route_id), targets = std::move(targets), handler = std::move(handler)](
                    std::exception_ptr health_error, std::vector<store::resp::Value> markers) mutable {
                    ResolvedPool pool;
                    if (!health_error) {
                        try {
                            for (std::size_t i = 0; i < targets.size(); ++i) {
                                auto marker = store::resp::as_string(markers[i], "GET");
                                if (marker && *marker == kUnhealthyMarker) {
                                    WAYPOINT_LOG_DEBUG(Router, "Route {}: upstream {} marked unhealthy",
                                                       route_id, targets[i].to_string());
                                    continue;
                                }
                                pool.insert(pool.end(), targets[i].weight, targets[i]);
                            }
                        } catch (const store::StoreError&) {
                            health_error = std::current_exception();
                        }
                    }
                    if (health_error) {
                        handler(health_error, ResolvedPool{});
                        return;
                    }
                    handler(nullptr, std::move(pool));
                });
        });
}

std::string RouteResolver::rewrite_path(const Route& route, std::string_view path) {
    const auto& prefix = route.path;
    if (!route.strip_path || prefix.size() <= 1 || !path.starts_with(prefix)) {
        return std::string(path);
    }

    auto rest = path.substr(prefix.size());
    if (rest.empty()) {
        return "/";
    }
    return std::string(rest);
}

} // namespace waypoint::routing
