/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Challenge Responder - ACME HTTP-01 key authorization lookup
 */

#ifndef WAYPOINT_ACME_CHALLENGE_RESPONDER_HPP
#define WAYPOINT_ACME_CHALLENGE_RESPONDER_HPP

#include "store/store_client.hpp"
#include "store/store_pool.hpp"

#include <boost/beast/http/status.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace waypoint::acme {

namespace http = boost::beast::http;

/**
 * Reserved path prefix intercepted before routing
 */
constexpr std::string_view kChallengePrefix = "/.well-known/acme-challenge/";

/**
 * Outcome of a challenge request
 */
struct ChallengeResponse {
    http::status status{http::status::not_found};
    std::string body;
    std::string content_type{"text/plain"};
};

/**
 * Whether a request path falls under the challenge prefix
 */
bool is_challenge_path(std::string_view path) noexcept;

/**
 * Token part of a challenge path
 * @return nullopt when the path is not a challenge path or the token is empty
 */
std::optional<std::string_view> extract_token(std::string_view path) noexcept;

/**
 * Completion of a challenge lookup
 */
using ChallengeHandler = std::function<void(ChallengeResponse response)>;

/**
 * Challenge Responder
 *
 * Answers with the exact stored key authorization, 404 for unknown tokens and
 * 500 when the store cannot be reached.
 */
class ChallengeResponder {
public:
    explicit ChallengeResponder(store::StorePool& pool);

    // Non-copyable
    ChallengeResponder(const ChallengeResponder&) = delete;
    ChallengeResponder& operator=(const ChallengeResponder&) = delete;

    /**
     * Answer a challenge request, leasing a store connection for the lookup
     * The handler always runs; store failures become a 500 response.
     */
    void async_respond(std::string_view path, ChallengeHandler handler) const;

    /**
     * Look a challenge token up against a given store client
     * The handler receives a store::StoreError when the store is unavailable.
     */
    static void async_lookup(store::StoreClient& store, std::string_view path,
                             std::function<void(std::exception_ptr, ChallengeResponse)> handler);

private:
    store::StorePool& pool_;
};

} // namespace waypoint::acme

#endif // WAYPOINT_ACME_CHALLENGE_RESPONDER_HPP
