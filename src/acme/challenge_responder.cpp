/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Challenge Responder implementation
 */

#include "acme/challenge_responder.hpp"
#include "store/keys.hpp"
#include "util/logger.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace waypoint::acme {

using util::log_component::Acme;

namespace {

ChallengeResponse server_error() {
    return ChallengeResponse{
        .status = http::status::internal_server_error,
        .body = "Internal Server Error"
    };
}

} // anonymous namespace

bool is_challenge_path(std::string_view path) noexcept {
    return path.starts_with(kChallengePrefix);
}

std::optional<std::string_view> extract_token(std::string_view path) noexcept {
    if (!is_challenge_path(path)) {
        return std::nullopt;
    }
    auto token = path.substr(kChallengePrefix.size());
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

ChallengeResponder::ChallengeResponder(store::StorePool& pool)
    : pool_(pool) {
}

void ChallengeResponder::async_respond(std::string_view path, ChallengeHandler handler) const {
    if (!extract_token(path)) {
        handler(ChallengeResponse{.status = http::status::not_found, .body = "Not Found"});
        return;
    }

    std::shared_ptr<store::StoreLease> lease;
    try {
        lease = std::make_shared<store::StoreLease>(pool_.acquire());
    } catch (const store::StoreError& e) {
        WAYPOINT_LOG_ERROR(Acme, "Store unavailable during challenge lookup: {}", e.what());
        handler(server_error());
        return;
    }

    auto& client = lease->client();
    async_lookup(client, path,
        [lease, handler = std::move(handler)](std::exception_ptr error, ChallengeResponse response) mutable {
            if (error) {
                lease->mark_failed();
            }
            lease->release();

            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    WAYPOINT_LOG_ERROR(Acme, "Store unavailable during challenge lookup: {}", e.what());
                }
                handler(server_error());
                return;
            }
            handler(std::move(response));
        });
}

void ChallengeResponder::async_lookup(store::StoreClient& store, std::string_view path,
                                      std::function<void(std::exception_ptr, ChallengeResponse)> handler) {
    auto token = extract_token(path);
    if (!token) {
        handler(nullptr, ChallengeResponse{.status = http::status::not_found, .body = "Not Found"});
        return;
    }

    std::vector<store::Command> lookup;
    lookup.push_back({"GET", store::keys::acme_challenge(*token)});

    store.async_execute(std::move(lookup),
        [token = std::string(*token), handler = std::move(handler)](
            std::exception_ptr error, std::vector<store::resp::Value> replies) mutable {
            std::optional<std::string> key_authorization;
            if (!error) {
                try {
                    key_authorization = store::resp::as_string(replies[0], "GET");
                } catch (const store::StoreError&) {
                    error = std::current_exception();
                }
            }
            if (error) {
                handler(error, ChallengeResponse{});
                return;
            }

            if (!key_authorization) {
                WAYPOINT_LOG_INFO(Acme, "Unknown challenge token {}", token);
                handler(nullptr, ChallengeResponse{.status = http::status::not_found, .body = "Not Found"});
                return;
            }

            WAYPOINT_LOG_INFO(Acme, "Answered challenge for token {}", token);
            handler(nullptr, ChallengeResponse{.status = http::status::ok, .body = std::move(*key_authorization)});
        });
}

} // namespace waypoint::acme
