/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Load Balancer - Strategy-based selection over a resolved backend pool
 */

#ifndef WAYPOINT_BALANCER_LOAD_BALANCER_HPP
#define WAYPOINT_BALANCER_LOAD_BALANCER_HPP

#include "config/config.hpp"
#include "routing/route.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace waypoint::balancer {

/**
 * Load balancing strategies
 */
enum class Strategy {
    RoundRobin,
    Random,
    IpHash
};

/**
 * Map a route's load_balancer name to a strategy
 *
 * "round_robin", "random" and "ip_hash" are recognized; any other name,
 * including an empty one, selects RoundRobin.
 */
Strategy parse_strategy(std::string_view name) noexcept;

std::string_view strategy_to_string(Strategy strategy) noexcept;

/**
 * Per-request inputs to selection
 */
struct SelectionContext {
    std::uint32_t worker_id{0};         // Stable id of the engine worker thread
    std::uint64_t connection_id{0};     // Engine-wide connection sequence number
    std::string client_ip;              // Empty if unknown
};

/**
 * Result of backend selection
 */
struct BackendSelection {
    routing::BackendTarget backend;
    std::size_t index;  // Index in the resolved pool for debugging/logging
};

/**
 * Load Balancer
 *
 * Selection is a pure function of the pool, the strategy and the selection
 * context: no store access and no state shared between requests. The only
 * exception is the optional per-thread random generator.
 *
 * Strategies:
 * - RoundRobin: (worker_id + connection_id) mod pool size
 * - Random: uniform index, reseeded from wall clock and pid per selection
 *   unless configured to use a per-thread generator seeded once
 * - IpHash: CRC-32 of the client IP (127.0.0.1 if unknown) mod pool size
 *
 * Weights are already applied by pool expansion, so every strategy treats the
 * pool as uniform.
 */
class LoadBalancer {
public:
    explicit LoadBalancer(config::BalancerSettings config = {});

    /**
     * Select a backend from the pool
     * @return Selection, or nullopt if the pool is empty
     *
     * Thread-safe: can be called from multiple threads concurrently
     */
    std::optional<BackendSelection> select(const routing::ResolvedPool& pool,
                                           Strategy strategy,
                                           const SelectionContext& context) const;

    /**
     * CRC-32 checksum used by the IpHash strategy
     */
    static std::uint32_t client_checksum(std::string_view client_ip);

    const config::BalancerSettings& config() const noexcept { return config_; }

private:
    std::size_t random_index(std::size_t size) const;

    config::BalancerSettings config_;
};

} // namespace waypoint::balancer

#endif // WAYPOINT_BALANCER_LOAD_BALANCER_HPP
