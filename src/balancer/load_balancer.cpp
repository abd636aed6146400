/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Load Balancer - Implementation of the selection strategies
 */

#include "balancer/load_balancer.hpp"
#include "util/logger.hpp"

#include <boost/crc.hpp>

#include <unistd.h>

#include <chrono>
#include <functional>
#include <random>
#include <thread>

namespace waypoint::balancer {

using util::log_component::Balancer;

namespace {

constexpr std::string_view kDefaultClientIp = "127.0.0.1";

/**
 * Seed derived from wall-clock milliseconds and the process id
 */
std::uint64_t time_and_process_seed() {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<std::uint64_t>(now_ms) + static_cast<std::uint64_t>(::getpid());
}

} // anonymous namespace

Strategy parse_strategy(std::string_view name) noexcept {
    if (name == "random") return Strategy::Random;
    if (name == "ip_hash") return Strategy::IpHash;
    return Strategy::RoundRobin;
}

std::string_view strategy_to_string(Strategy strategy) noexcept {
    switch (strategy) {
        case Strategy::RoundRobin: return "round_robin";
        case Strategy::Random:     return "random";
        case Strategy::IpHash:     return "ip_hash";
    }
    return "round_robin";
}

LoadBalancer::LoadBalancer(config::BalancerSettings config)
    : config_(config) {
}

std::optional<BackendSelection> LoadBalancer::select(const routing::ResolvedPool& pool,
                                                     Strategy strategy,
                                                     const SelectionContext& context) const {
    if (pool.empty()) {
        WAYPOINT_LOG_WARN(Balancer, "No upstream available (empty pool)");
        return std::nullopt;
    }

    std::size_t index = 0;
    switch (strategy) {
        case Strategy::RoundRobin:
            index = static_cast<std::size_t>(
                (static_cast<std::uint64_t>(context.worker_id) + context.connection_id) % pool.size());
            break;

        case Strategy::Random:
            index = random_index(pool.size());
            break;

        case Strategy::IpHash:
            index = client_checksum(context.client_ip) % pool.size();
            break;
    }

    const auto& backend = pool[index];
    WAYPOINT_LOG_DEBUG(Balancer, "Selected {} (strategy={}, index={}, pool={})",
                       backend.to_string(), strategy_to_string(strategy), index, pool.size());

    return BackendSelection{
        .backend = backend,
        .index = index
    };
}

std::uint32_t LoadBalancer::client_checksum(std::string_view client_ip) {
    if (client_ip.empty()) {
        client_ip = kDefaultClientIp;
    }
    boost::crc_32_type crc;
    crc.process_bytes(client_ip.data(), client_ip.size());
    return crc.checksum();
}

std::size_t LoadBalancer::random_index(std::size_t size) const {
    std::uniform_int_distribution<std::size_t> dist(0, size - 1);

    if (config_.reseed_random_per_selection) {
        std::mt19937_64 generator(time_and_process_seed());
        return dist(generator);
    }

    thread_local std::mt19937_64 generator(
        time_and_process_seed() ^ std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return dist(generator);
}

} // namespace waypoint::balancer
