/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Request Context - Per-request state carried between the resolve and select stages
 */

#ifndef WAYPOINT_PROXY_REQUEST_CONTEXT_HPP
#define WAYPOINT_PROXY_REQUEST_CONTEXT_HPP

#include "balancer/load_balancer.hpp"
#include "routing/route_resolver.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace waypoint::proxy {

/**
 * Request-scoped context
 *
 * Owned by exactly one request. The decision is written once by the resolve
 * stage and only read afterwards.
 */
struct RequestContext {
    std::string request_id;
    std::string client_ip;
    std::uint64_t connection_id{0};
    std::uint32_t worker_id{0};
    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    std::shared_ptr<const routing::RouteDecision> decision;

    balancer::SelectionContext selection_context() const {
        return balancer::SelectionContext{
            .worker_id = worker_id,
            .connection_id = connection_id,
            .client_ip = client_ip
        };
    }

    std::chrono::microseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time);
    }
};

} // namespace waypoint::proxy

#endif // WAYPOINT_PROXY_REQUEST_CONTEXT_HPP
