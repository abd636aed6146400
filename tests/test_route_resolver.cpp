/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Route resolution and pool expansion tests against an in-memory store
 */

#include "routing/route_resolver.hpp"
#include "support/memory_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <exception>
#include <optional>

using namespace waypoint;
using waypoint::test::MemoryStore;

class RouteResolverTest : public ::testing::Test {
protected:
    MemoryStore store_;
    routing::RouteResolver resolver_;

    void add_route(const std::string& host, const std::string& id, const std::string& document) {
        store_.data().add_route(host, id, document);
    }

    // The memory store completes inline, so each call below returns with the result

    std::optional<routing::Route> match_route(const std::string& host, const std::string& path) {
        std::optional<routing::Route> result;
        bool completed = false;
        resolver_.async_match_route(store_, host, path,
            [&](std::exception_ptr error, std::optional<routing::Route> route) {
                completed = true;
                if (error) std::rethrow_exception(error);
                result = std::move(route);
            });
        EXPECT_TRUE(completed);
        return result;
    }

    routing::ResolvedPool resolve_pool(const std::string& route_id) {
        routing::ResolvedPool result;
        bool completed = false;
        routing::RouteResolver::async_resolve_pool(store_, route_id,
            [&](std::exception_ptr error, routing::ResolvedPool pool) {
                completed = true;
                if (error) std::rethrow_exception(error);
                result = std::move(pool);
            });
        EXPECT_TRUE(completed);
        return result;
    }

    std::optional<routing::RouteDecision> resolve(const std::string& host, const std::string& path) {
        std::optional<routing::RouteDecision> result;
        bool completed = false;
        resolver_.async_resolve(store_, host, path,
            [&](std::exception_ptr error, std::optional<routing::RouteDecision> decision) {
                completed = true;
                if (error) std::rethrow_exception(error);
                result = std::move(decision);
            });
        EXPECT_TRUE(completed);
        return result;
    }
};

TEST_F(RouteResolverTest, LongestPrefixWins) {
    add_route("example.com", "root", R"({"path": "/"})");
    add_route("example.com", "api", R"({"path": "/api"})");

    auto route = match_route("example.com", "/api/x");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "api");

    route = match_route("example.com", "/about");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "root");
}

TEST_F(RouteResolverTest, DisabledRouteIsNeverSelected) {
    add_route("example.com", "root", R"({"path": "/"})");
    add_route("example.com", "api", R"({"path": "/api", "enabled": false})");

    auto route = match_route("example.com", "/api/x");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "root");
}

TEST_F(RouteResolverTest, OnlyDisabledRoutesMeansNoMatch) {
    add_route("example.com", "api", R"({"path": "/api", "enabled": false})");

    EXPECT_FALSE(match_route("example.com", "/api").has_value());
}

TEST_F(RouteResolverTest, PrefixMatchIsPlainStringPrefix) {
    add_route("example.com", "api", R"({"path": "/api"})");

    // "/apix" starts with "/api"
    EXPECT_TRUE(match_route("example.com", "/apix").has_value());
    EXPECT_FALSE(match_route("example.com", "/ap").has_value());
}

TEST_F(RouteResolverTest, EqualPrefixTieBreaksOnSmallestId) {
    add_route("example.com", "zeta", R"({"path": "/api"})");
    add_route("example.com", "alpha", R"({"path": "/api"})");
    add_route("example.com", "mid", R"({"path": "/api"})");

    for (int i = 0; i < 5; ++i) {
        auto route = match_route("example.com", "/api/users");
        ASSERT_TRUE(route.has_value());
        EXPECT_EQ(route->id, "alpha");
    }
}

TEST_F(RouteResolverTest, UnknownHostHasNoRoute) {
    add_route("example.com", "root", R"({"path": "/"})");

    EXPECT_FALSE(match_route("other.com", "/").has_value());
}

TEST_F(RouteResolverTest, MissingAndMalformedDocumentsAreSkipped) {
    add_route("example.com", "good", R"({"path": "/"})");
    add_route("example.com", "broken", "{not json");
    store_.data().sets[store::keys::route_index("example.com")].insert("ghost");

    auto route = match_route("example.com", "/anything");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "good");
}

TEST_F(RouteResolverTest, NormalizedHostIsLookedUpFirst) {
    add_route("shop", "shop-normalized", R"({"path": "/"})");
    add_route("shop.10.0.0.7.nip.io", "shop-raw", R"({"path": "/"})");

    auto route = match_route("shop.10.0.0.7.nip.io", "/");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "shop-normalized");
}

TEST_F(RouteResolverTest, FallsBackToRawHostIndex) {
    add_route("shop.10.0.0.7.nip.io", "shop-raw", R"({"path": "/"})");

    auto route = match_route("shop.10.0.0.7.nip.io", "/");
    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(route->id, "shop-raw");
}

TEST_F(RouteResolverTest, WeightedPoolExpansion) {
    store_.data().set_upstreams("api", {"a:1:2", "b:2:1"});

    auto pool = resolve_pool("api");
    ASSERT_EQ(pool.size(), 3u);
    EXPECT_EQ(std::count_if(pool.begin(), pool.end(),
                            [](const auto& t) { return t.address == "a"; }), 2);
    EXPECT_EQ(std::count_if(pool.begin(), pool.end(),
                            [](const auto& t) { return t.address == "b"; }), 1);
    // Store order is kept
    EXPECT_EQ(pool[0].address, "a");
    EXPECT_EQ(pool[1].address, "a");
    EXPECT_EQ(pool[2].address, "b");
}

TEST_F(RouteResolverTest, UnhealthyTargetsAreExcluded) {
    store_.data().set_upstreams("api", {"a:1", "b:2", "c:3"});
    store_.data().mark_unhealthy("api", "b", 2);

    auto pool = resolve_pool("api");
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool[0].address, "a");
    EXPECT_EQ(pool[1].address, "c");
}

TEST_F(RouteResolverTest, OnlyExactUnhealthyMarkerExcludes) {
    store_.data().set_upstreams("api", {"a:1", "b:2"});
    store_.data().strings[store::keys::upstream_health("api", "a", 1)] = "healthy";
    store_.data().strings[store::keys::upstream_health("api", "b", 2)] = "UNHEALTHY";

    EXPECT_EQ(resolve_pool("api").size(), 2u);
}

TEST_F(RouteResolverTest, MissingHealthMarkerMeansHealthy) {
    store_.data().set_upstreams("api", {"a:1"});

    auto pool = resolve_pool("api");
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0].to_string(), "a:1");
}

TEST_F(RouteResolverTest, MalformedUpstreamsAreIgnored) {
    store_.data().set_upstreams("api", {"nonsense", "a:1", "b:notaport"});

    auto pool = resolve_pool("api");
    ASSERT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool[0].address, "a");
}

TEST_F(RouteResolverTest, AllUnhealthyGivesEmptyPool) {
    store_.data().set_upstreams("api", {"a:1", "b:2"});
    store_.data().mark_unhealthy("api", "a", 1);
    store_.data().mark_unhealthy("api", "b", 2);

    EXPECT_TRUE(resolve_pool("api").empty());
}

TEST_F(RouteResolverTest, ResolveBuildsDecision) {
    add_route("example.com", "api", R"({"path": "/api", "strip_path": true, "load_balancer": "random"})");
    store_.data().set_upstreams("api", {"10.0.0.1:8080:2"});

    auto decision = resolve("example.com", "/api/users");
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->route.id, "api");
    EXPECT_EQ(decision->route.load_balancer, "random");
    EXPECT_EQ(decision->pool.size(), 2u);
    EXPECT_EQ(decision->upstream_path, "/users");
}

TEST_F(RouteResolverTest, ResolveWithoutRoute) {
    EXPECT_FALSE(resolve("example.com", "/").has_value());
}

TEST_F(RouteResolverTest, StoreFailurePropagates) {
    add_route("example.com", "root", R"({"path": "/"})");
    store_.data().fail = true;

    EXPECT_THROW(resolve("example.com", "/"), store::StoreError);
}

TEST_F(RouteResolverTest, StoreErrorReplyPropagates) {
    add_route("example.com", "root", R"({"path": "/"})");
    // A string where a set is expected makes SMEMBERS answer with an error reply
    store_.data().sets.clear();
    store_.data().strings[store::keys::route_index("example.com")] = "oops";

    EXPECT_THROW(resolve("example.com", "/"), store::StoreError);
}

TEST_F(RouteResolverTest, LookupsArePipelinedPerStage) {
    add_route("example.com", "a", R"({"path": "/"})");
    add_route("example.com", "b", R"({"path": "/b"})");
    store_.data().set_upstreams("b", {"x:1", "y:2"});

    auto decision = resolve("example.com", "/b/c");
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->route.id, "b");

    // SMEMBERS, two route GETs, LRANGE and two health GETs
    EXPECT_EQ(store_.data().calls.load(), 6u);
}

TEST(RewritePathTest, StripsPrefix) {
    routing::Route route;
    route.path = "/api";
    route.strip_path = true;

    EXPECT_EQ(routing::RouteResolver::rewrite_path(route, "/api/x"), "/x");
    EXPECT_EQ(routing::RouteResolver::rewrite_path(route, "/api"), "/");
    EXPECT_EQ(routing::RouteResolver::rewrite_path(route, "/api/x/y"), "/x/y");
}

TEST(RewritePathTest, NoStripWhenDisabled) {
    routing::Route route;
    route.path = "/api";
    route.strip_path = false;

    EXPECT_EQ(routing::RouteResolver::rewrite_path(route, "/api/x"), "/api/x");
}

TEST(RewritePathTest, RootPrefixIsNeverStripped) {
    routing::Route route;
    route.path = "/";
    route.strip_path = true;

    EXPECT_EQ(routing::RouteResolver::rewrite_path(route, "/x"), "/x");
}
