/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Load balancer strategy tests
 */

#include "balancer/load_balancer.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace waypoint;
using balancer::LoadBalancer;
using balancer::SelectionContext;
using balancer::Strategy;

namespace {

routing::ResolvedPool make_pool(std::initializer_list<const char*> addresses) {
    routing::ResolvedPool pool;
    std::uint16_t port = 8000;
    for (const char* address : addresses) {
        pool.push_back(routing::BackendTarget{.address = address, .port = port++, .weight = 1});
    }
    return pool;
}

} // anonymous namespace

TEST(StrategyTest, ParsesKnownNames) {
    EXPECT_EQ(balancer::parse_strategy("round_robin"), Strategy::RoundRobin);
    EXPECT_EQ(balancer::parse_strategy("random"), Strategy::Random);
    EXPECT_EQ(balancer::parse_strategy("ip_hash"), Strategy::IpHash);
}

TEST(StrategyTest, UnknownNamesSelectRoundRobin) {
    EXPECT_EQ(balancer::parse_strategy(""), Strategy::RoundRobin);
    EXPECT_EQ(balancer::parse_strategy("least_conn"), Strategy::RoundRobin);
    EXPECT_EQ(balancer::parse_strategy("IP_HASH"), Strategy::RoundRobin);
}

TEST(StrategyTest, ToStringRoundTrips) {
    for (auto strategy : {Strategy::RoundRobin, Strategy::Random, Strategy::IpHash}) {
        EXPECT_EQ(balancer::parse_strategy(balancer::strategy_to_string(strategy)), strategy);
    }
}

TEST(LoadBalancerTest, EmptyPoolFailsForEveryStrategy) {
    LoadBalancer lb;
    routing::ResolvedPool empty;
    SelectionContext ctx{.worker_id = 1, .connection_id = 7, .client_ip = "10.0.0.1"};

    for (auto strategy : {Strategy::RoundRobin, Strategy::Random, Strategy::IpHash}) {
        EXPECT_FALSE(lb.select(empty, strategy, ctx).has_value());
    }
}

TEST(LoadBalancerTest, RoundRobinUsesWorkerAndConnection) {
    LoadBalancer lb;
    auto pool = make_pool({"a", "b", "c"});

    SelectionContext ctx{.worker_id = 1, .connection_id = 1, .client_ip = ""};
    auto selection = lb.select(pool, Strategy::RoundRobin, ctx);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->index, 2u);
    EXPECT_EQ(selection->backend.address, "c");

    ctx.connection_id = 2;
    selection = lb.select(pool, Strategy::RoundRobin, ctx);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->index, 0u);
    EXPECT_EQ(selection->backend.address, "a");
}

TEST(LoadBalancerTest, RoundRobinCyclesOverConnections) {
    LoadBalancer lb;
    auto pool = make_pool({"a", "b", "c", "d"});

    std::set<std::size_t> seen;
    for (std::uint64_t conn = 1; conn <= 4; ++conn) {
        SelectionContext ctx{.worker_id = 3, .connection_id = conn, .client_ip = ""};
        seen.insert(lb.select(pool, Strategy::RoundRobin, ctx)->index);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(LoadBalancerTest, RandomStaysInRange) {
    LoadBalancer lb;
    auto pool = make_pool({"a", "b", "c"});
    SelectionContext ctx;

    for (int i = 0; i < 200; ++i) {
        auto selection = lb.select(pool, Strategy::Random, ctx);
        ASSERT_TRUE(selection.has_value());
        EXPECT_LT(selection->index, pool.size());
        EXPECT_EQ(selection->backend, pool[selection->index]);
    }
}

TEST(LoadBalancerTest, RandomWithProcessSeededGeneratorCoversPool) {
    LoadBalancer lb(config::BalancerSettings{.reseed_random_per_selection = false});
    auto pool = make_pool({"a", "b", "c"});
    SelectionContext ctx;

    std::set<std::size_t> seen;
    for (int i = 0; i < 500; ++i) {
        seen.insert(lb.select(pool, Strategy::Random, ctx)->index);
    }
    EXPECT_EQ(seen.size(), pool.size());
}

TEST(LoadBalancerTest, IpHashIsStableForSameClient) {
    LoadBalancer lb;
    auto pool = make_pool({"a", "b", "c", "d", "e"});
    SelectionContext ctx{.worker_id = 1, .connection_id = 1, .client_ip = "203.0.113.9"};

    auto first = lb.select(pool, Strategy::IpHash, ctx);
    ctx.worker_id = 4;
    ctx.connection_id = 99;
    auto second = lb.select(pool, Strategy::IpHash, ctx);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->index, second->index);
    EXPECT_EQ(first->backend, second->backend);
}

TEST(LoadBalancerTest, IpHashMappingFollowsPoolOrder) {
    LoadBalancer lb;
    auto pool = make_pool({"a", "b", "c"});
    SelectionContext ctx{.worker_id = 1, .connection_id = 1, .client_ip = "198.51.100.23"};

    auto index = LoadBalancer::client_checksum(ctx.client_ip) % pool.size();
    auto selection = lb.select(pool, Strategy::IpHash, ctx);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->index, index);

    // Same index, different target once the pool is reordered
    routing::ResolvedPool reversed(pool.rbegin(), pool.rend());
    auto reordered = lb.select(reversed, Strategy::IpHash, ctx);
    ASSERT_TRUE(reordered.has_value());
    EXPECT_EQ(reordered->index, index);
    if (index != 1) {
        EXPECT_NE(reordered->backend, selection->backend);
    }
}

TEST(LoadBalancerTest, ChecksumIsCrc32) {
    // Standard CRC-32 check value
    EXPECT_EQ(LoadBalancer::client_checksum("123456789"), 0xCBF43926u);
}

TEST(LoadBalancerTest, UnknownClientHashesAsLoopback) {
    EXPECT_EQ(LoadBalancer::client_checksum(""), LoadBalancer::client_checksum("127.0.0.1"));
}

TEST(LoadBalancerTest, SingleTargetPoolAlwaysSelected) {
    LoadBalancer lb;
    auto pool = make_pool({"only"});
    SelectionContext ctx{.worker_id = 2, .connection_id = 11, .client_ip = "10.1.1.1"};

    for (auto strategy : {Strategy::RoundRobin, Strategy::Random, Strategy::IpHash}) {
        auto selection = lb.select(pool, strategy, ctx);
        ASSERT_TRUE(selection.has_value());
        EXPECT_EQ(selection->index, 0u);
        EXPECT_EQ(selection->backend.address, "only");
    }
}
