/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Request Pipeline - Challenge interception, route resolution and backend selection
 *
 * Per request:
 * 1. ACME challenge paths are answered from the store and never routed
 * 2. Resolve: route match, pool read and health filtering (all store I/O)
 * 3. Select: pure strategy over the resolved pool
 * 4. The decision is handed off in X-Waypoint-* response headers
 */

#ifndef WAYPOINT_PROXY_PIPELINE_HPP
#define WAYPOINT_PROXY_PIPELINE_HPP

#include "acme/challenge_responder.hpp"
#include "balancer/load_balancer.hpp"
#include "proxy/request_context.hpp"
#include "routing/route_resolver.hpp"
#include "server/http_message.hpp"
#include "store/store_pool.hpp"
#include "util/logger.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace waypoint::proxy {

/**
 * Response headers carrying the decision to the forwarding tier
 */
namespace handoff_header {
    constexpr std::string_view Route = "X-Waypoint-Route";
    constexpr std::string_view Upstream = "X-Waypoint-Upstream";
    constexpr std::string_view Uri = "X-Waypoint-Uri";
    constexpr std::string_view RequestId = "X-Request-ID";
}

/**
 * Request pipeline
 *
 * Stateless between requests; one instance serves all worker threads. The
 * pool and balancer must outlive the pipeline.
 */
class RequestPipeline {
public:
    RequestPipeline(store::StorePool& pool,
                    const balancer::LoadBalancer& balancer,
                    routing::RouteResolver resolver = routing::RouteResolver{});

    // Non-copyable
    RequestPipeline(const RequestPipeline&) = delete;
    RequestPipeline& operator=(const RequestPipeline&) = delete;

    /**
     * Handle one request
     *
     * The response is delivered through done, exactly once, from whichever
     * thread completes the last store round-trip. Failures map to status
     * codes; done is never skipped.
     */
    void handle(const server::HttpRequest& request, server::ResponseCallback done) const;

    /**
     * Resolve stage on a leased connection
     *
     * The lease is returned before the handler runs; it is marked failed
     * when the store errors. The decision is nullptr if no route matches.
     */
    void async_resolve(const server::HttpRequest& request, std::shared_ptr<store::StoreLease> lease,
                       std::function<void(std::exception_ptr,
                                          std::shared_ptr<const routing::RouteDecision>)> handler) const;

private:
    struct Exchange;

    void route(std::shared_ptr<Exchange> exchange) const;
    server::HttpResponse select(const Exchange& exchange, util::AccessLogEntry& entry) const;
    void finish(Exchange& exchange, server::HttpResponse response) const;

    store::StorePool& pool_;
    const balancer::LoadBalancer& balancer_;
    routing::RouteResolver resolver_;
    acme::ChallengeResponder challenges_;
};

/**
 * Build a JSON error response {"error": message}
 */
server::HttpResponse error_response(server::http::status status, std::string_view message);

} // namespace waypoint::proxy

#endif // WAYPOINT_PROXY_PIPELINE_HPP
