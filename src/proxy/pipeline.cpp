/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Request Pipeline implementation
 */

#include "proxy/pipeline.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>
#include <utility>

namespace waypoint::proxy {

using util::log_component::Pipeline;
namespace http = server::http;

server::HttpResponse error_response(http::status status, std::string_view message) {
    nlohmann::json body = {{"error", std::string(message)}};
    return server::HttpResponse{
        .status = status,
        .content_type = "application/json",
        .body = body.dump()
    };
}

RequestPipeline::RequestPipeline(store::StorePool& pool,
                                 const balancer::LoadBalancer& balancer,
                                 routing::RouteResolver resolver)
    : pool_(pool)
    , balancer_(balancer)
    , resolver_(std::move(resolver))
    , challenges_(pool) {
}

struct RequestPipeline::Exchange {
    server::HttpRequest request;
    RequestContext ctx;
    util::AccessLogEntry entry;
    server::ResponseCallback done;
};

void RequestPipeline::handle(const server::HttpRequest& request, server::ResponseCallback done) const {
    auto exchange = std::make_shared<Exchange>();
    exchange->request = request;
    exchange->done = std::move(done);

    auto& ctx = exchange->ctx;
    ctx.request_id = request.x_request_id.empty() ? util::generate_request_id() : request.x_request_id;
    ctx.client_ip = request.client_ip;
    ctx.connection_id = request.connection_id;
    ctx.worker_id = request.worker_id;

    auto& entry = exchange->entry;
    entry.request_id = ctx.request_id;
    entry.client_ip = ctx.client_ip;
    entry.method = request.method_string;
    entry.path = request.path;

    if (acme::is_challenge_path(request.path)) {
        challenges_.async_respond(exchange->request.path, [this, exchange](acme::ChallengeResponse challenge) {
            server::HttpResponse response;
            response.status = challenge.status;
            response.content_type = std::move(challenge.content_type);
            response.body = std::move(challenge.body);
            finish(*exchange, std::move(response));
        });
        return;
    }

    route(std::move(exchange));
}

void RequestPipeline::async_resolve(const server::HttpRequest& request, std::shared_ptr<store::StoreLease> lease,
                                    std::function<void(std::exception_ptr,
                                                       std::shared_ptr<const routing::RouteDecision>)> handler) const {
    auto& client = lease->client();
    resolver_.async_resolve(client, request.host, request.path.empty() ? "/" : request.path,
        [lease, handler = std::move(handler)](std::exception_ptr error,
                                              std::optional<routing::RouteDecision> decision) mutable {
            if (error) {
                lease->mark_failed();
            }
            lease->release();

            if (error) {
                handler(error, nullptr);
                return;
            }
            if (!decision) {
                handler(nullptr, nullptr);
                return;
            }
            handler(nullptr, std::make_shared<const routing::RouteDecision>(std::move(*decision)));
        });
}

void RequestPipeline::route(std::shared_ptr<Exchange> exchange) const {
    const auto& request = exchange->request;

    std::shared_ptr<store::StoreLease> lease;
    try {
        lease = std::make_shared<store::StoreLease>(pool_.acquire());
    } catch (const store::StoreError& e) {
        WAYPOINT_LOG_ERROR(Pipeline, "[{}] Store unavailable while routing {}{}: {}",
                           exchange->ctx.request_id, request.host, request.path, e.what());
        finish(*exchange, error_response(http::status::bad_gateway, "Route store unavailable"));
        return;
    }

    async_resolve(request, std::move(lease),
        [this, exchange](std::exception_ptr error, std::shared_ptr<const routing::RouteDecision> decision) {
            const auto& request = exchange->request;
            const auto& request_id = exchange->ctx.request_id;

            server::HttpResponse response;
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const store::StoreError& e) {
                    WAYPOINT_LOG_ERROR(Pipeline, "[{}] Store unavailable while routing {}{}: {}",
                                       request_id, request.host, request.path, e.what());
                    response = error_response(http::status::bad_gateway, "Route store unavailable");
                } catch (const std::exception& e) {
                    WAYPOINT_LOG_ERROR(Pipeline, "[{}] Unhandled error for {}{}: {}",
                                       request_id, request.host, request.path, e.what());
                    response = error_response(http::status::internal_server_error, "Internal server error");
                }
                finish(*exchange, std::move(response));
                return;
            }

            exchange->ctx.decision = std::move(decision);
            try {
                response = select(*exchange, exchange->entry);
            } catch (const std::exception& e) {
                WAYPOINT_LOG_ERROR(Pipeline, "[{}] Unhandled error for {}{}: {}",
                                   request_id, request.host, request.path, e.what());
                response = error_response(http::status::internal_server_error, "Internal server error");
            }
            finish(*exchange, std::move(response));
        });
}

void RequestPipeline::finish(Exchange& exchange, server::HttpResponse response) const {
    response.headers.emplace_back(std::string(handoff_header::RequestId), exchange.ctx.request_id);

    exchange.entry.status_code = static_cast<int>(response.status);
    exchange.entry.latency = exchange.ctx.elapsed();
    util::Logger::instance().access(exchange.entry);

    auto done = std::move(exchange.done);
    done(std::move(response));
}

server::HttpResponse RequestPipeline::select(const Exchange& exchange, util::AccessLogEntry& entry) const {
    const auto& request = exchange.request;
    const auto& ctx = exchange.ctx;

    if (!ctx.decision) {
        WAYPOINT_LOG_DEBUG(Pipeline, "[{}] No route for {}{}", ctx.request_id, request.host, request.path);
        return error_response(http::status::not_found, "No route found");
    }

    const auto& decision = *ctx.decision;
    entry.route_id = decision.route.id;

    if (decision.pool.empty()) {
        WAYPOINT_LOG_WARN(Pipeline, "[{}] Route {} has no healthy upstreams", ctx.request_id, decision.route.id);
        return error_response(http::status::bad_gateway, "No healthy upstreams");
    }

    auto strategy = balancer::parse_strategy(decision.route.load_balancer);
    auto selection = balancer_.select(decision.pool, strategy, ctx.selection_context());
    if (!selection) {
        WAYPOINT_LOG_WARN(Pipeline, "[{}] Route {}: backend selection failed", ctx.request_id, decision.route.id);
        return error_response(http::status::bad_gateway, "Backend selection failed");
    }

    auto upstream = selection->backend.to_string();
    entry.upstream = upstream;

    std::string uri = decision.upstream_path;
    if (!request.query.empty()) {
        uri += '?';
        uri += request.query;
    }

    WAYPOINT_LOG_DEBUG(Pipeline, "[{}] {} {}{} -> {} via {} (index={}, uri={})",
                       ctx.request_id, request.method_string, request.host, request.path,
                       upstream, balancer::strategy_to_string(strategy), selection->index, uri);

    server::HttpResponse response;
    response.status = http::status::ok;
    response.content_type.clear();
    response.headers.emplace_back(std::string(handoff_header::Route), decision.route.id);
    response.headers.emplace_back(std::string(handoff_header::Upstream), std::move(upstream));
    response.headers.emplace_back(std::string(handoff_header::Uri), std::move(uri));
    return response;
}

} // namespace waypoint::proxy
