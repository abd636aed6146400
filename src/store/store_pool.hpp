/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Store Pool - Process-wide pool of store connections with RAII leases
 */

#ifndef WAYPOINT_STORE_STORE_POOL_HPP
#define WAYPOINT_STORE_STORE_POOL_HPP

#include "store/redis_client.hpp"
#include "store/store_client.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace waypoint::store {

/**
 * Configuration for the store pool
 */
struct StorePoolConfig {
    RedisConfig redis;
    std::size_t max_idle{100};                      // Idle connections kept for reuse
    std::chrono::milliseconds idle_timeout{10000};  // Idle connections older than this are closed
};

/**
 * Creates a client; throws StoreError when no client can be created
 */
using ClientFactory = std::function<std::unique_ptr<StoreClient>(const RedisConfig&)>;

namespace detail {

/**
 * Pool internals, shared with outstanding leases so that a lease returned
 * after the pool is gone only closes its client
 */
struct PoolState {
    struct IdleClient {
        std::unique_ptr<StoreClient> client;
        std::chrono::steady_clock::time_point returned_at;
    };

    explicit PoolState(const StorePoolConfig& pool_config, ClientFactory client_factory)
        : factory(std::move(client_factory))
        , config(pool_config) {
    }

    void release(std::unique_ptr<StoreClient> client, std::uint64_t client_generation, bool reusable);

    ClientFactory factory;

    mutable std::mutex mutex;
    StorePoolConfig config;
    std::uint64_t generation{0};
    std::deque<IdleClient> idle;
    bool closed{false};
    std::atomic<std::size_t> in_use{0};
    std::atomic<std::uint64_t> total_created{0};
};

} // namespace detail

/**
 * RAII lease on a pooled client
 * Returns the client to the pool on destruction unless it failed.
 */
class StoreLease {
public:
    StoreLease(std::shared_ptr<detail::PoolState> pool, std::unique_ptr<StoreClient> client,
               std::uint64_t generation);
    ~StoreLease();

    StoreLease(const StoreLease&) = delete;
    StoreLease& operator=(const StoreLease&) = delete;
    StoreLease(StoreLease&& other) noexcept;
    StoreLease& operator=(StoreLease&& other) noexcept;

    StoreClient& operator*() { return *client_; }
    StoreClient* operator->() { return client_.get(); }
    StoreClient& client() { return *client_; }

    /**
     * Mark the client as unusable; it is closed instead of returned
     */
    void mark_failed() { failed_ = true; }

    /**
     * Return the client early
     */
    void release();

    explicit operator bool() const { return client_ != nullptr; }

private:
    std::shared_ptr<detail::PoolState> pool_;
    std::unique_ptr<StoreClient> client_;
    std::uint64_t generation_;
    bool failed_{false};
};

/**
 * Store pool
 *
 * Owned by process-wide state and shared by all request phases. A lease is
 * taken per phase invocation and returned as soon as its last round-trip
 * completes; no connection is held across requests. Thread-safe.
 */
class StorePool {
public:
    /**
     * Create a pool whose RedisClient connections run on an executor
     */
    StorePool(const StorePoolConfig& config, asio::any_io_executor executor);

    /**
     * Create a pool with a custom client factory
     */
    StorePool(const StorePoolConfig& config, ClientFactory factory);

    ~StorePool();

    StorePool(const StorePool&) = delete;
    StorePool& operator=(const StorePool&) = delete;

    /**
     * Lease a client, reusing an idle one when available
     *
     * Idle clients that have expired, or whose server closed the connection,
     * are discarded here rather than handed out.
     * @throws StoreError if the factory cannot create a client
     */
    StoreLease acquire();

    /**
     * Apply new settings; idle connections are closed and leased ones are
     * discarded when they come back
     */
    void reconfigure(const StorePoolConfig& config);

    /**
     * Close all idle connections
     */
    void close_all();

    std::size_t idle_count() const;
    std::size_t in_use_count() const;
    std::uint64_t total_created() const;

    StorePoolConfig config() const;

private:
    std::shared_ptr<detail::PoolState> state_;
};

} // namespace waypoint::store

#endif // WAYPOINT_STORE_STORE_POOL_HPP
