/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Store Pool - Implementation
 */

#include "store/store_pool.hpp"
#include "util/logger.hpp"

namespace waypoint::store {

using util::log_component::Store;

// ============================================================================
// StoreLease Implementation
// ============================================================================

StoreLease::StoreLease(std::shared_ptr<detail::PoolState> pool, std::unique_ptr<StoreClient> client,
                       std::uint64_t generation)
    : pool_(std::move(pool))
    , client_(std::move(client))
    , generation_(generation) {
}

StoreLease::~StoreLease() {
    release();
}

StoreLease::StoreLease(StoreLease&& other) noexcept
    : pool_(std::move(other.pool_))
    , client_(std::move(other.client_))
    , generation_(other.generation_)
    , failed_(other.failed_) {
}

StoreLease& StoreLease::operator=(StoreLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::move(other.pool_);
        client_ = std::move(other.client_);
        generation_ = other.generation_;
        failed_ = other.failed_;
    }
    return *this;
}

void StoreLease::release() {
    if (pool_ && client_) {
        bool reusable = !failed_ && client_->is_open();
        pool_->release(std::move(client_), generation_, reusable);
    }
    pool_.reset();
}

// ============================================================================
// PoolState Implementation
// ============================================================================

void detail::PoolState::release(std::unique_ptr<StoreClient> client, std::uint64_t client_generation,
                                bool reusable) {
    if (in_use > 0) {
        in_use--;
    }

    if (!client || !reusable) {
        WAYPOINT_LOG_DEBUG(Store, "Discarding store connection");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (closed || client_generation != generation || idle.size() >= config.max_idle) {
        return;
    }
    idle.push_front(IdleClient{std::move(client), std::chrono::steady_clock::now()});
}

// ============================================================================
// StorePool Implementation
// ============================================================================

StorePool::StorePool(const StorePoolConfig& config, asio::any_io_executor executor)
    : StorePool(config, [executor](const RedisConfig& redis) -> std::unique_ptr<StoreClient> {
          return std::make_unique<RedisClient>(executor, redis);
      }) {
}

StorePool::StorePool(const StorePoolConfig& config, ClientFactory factory)
    : state_(std::make_shared<detail::PoolState>(config, std::move(factory))) {
    WAYPOINT_LOG_INFO(Store, "Store pool for {}:{} (max_idle={}, idle_timeout={}ms, timeout={}ms)",
                      config.redis.host, config.redis.port, config.max_idle,
                      config.idle_timeout.count(), config.redis.timeout.count());
}

StorePool::~StorePool() {
    std::deque<detail::PoolState::IdleClient> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        dropped.swap(state_->idle);
    }
}

StoreLease StorePool::acquire() {
    RedisConfig redis;
    std::uint64_t generation = 0;
    std::unique_ptr<StoreClient> client;

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto now = std::chrono::steady_clock::now();

        // Most recently returned first
        while (!state_->idle.empty()) {
            auto candidate = std::move(state_->idle.front());
            state_->idle.pop_front();

            if (now - candidate.returned_at > state_->config.idle_timeout) {
                continue;
            }
            if (!candidate.client->is_open()) {
                WAYPOINT_LOG_DEBUG(Store, "Dropping idle store connection closed by the server");
                continue;
            }
            client = std::move(candidate.client);
            break;
        }

        redis = state_->config.redis;
        generation = state_->generation;
    }

    if (!client) {
        client = state_->factory(redis);
        state_->total_created++;
        WAYPOINT_LOG_DEBUG(Store, "Opened store connection (total_created={})", state_->total_created.load());
    }

    state_->in_use++;
    return StoreLease(state_, std::move(client), generation);
}

void StorePool::reconfigure(const StorePoolConfig& config) {
    std::deque<detail::PoolState::IdleClient> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->config = config;
        ++state_->generation;
        dropped.swap(state_->idle);
    }
    WAYPOINT_LOG_INFO(Store, "Store pool reconfigured for {}:{} (closed {} idle connections)",
                      config.redis.host, config.redis.port, dropped.size());
}

void StorePool::close_all() {
    std::deque<detail::PoolState::IdleClient> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        dropped.swap(state_->idle);
    }
}

std::size_t StorePool::idle_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->idle.size();
}

std::size_t StorePool::in_use_count() const {
    return state_->in_use.load();
}

std::uint64_t StorePool::total_created() const {
    return state_->total_created.load();
}

StorePoolConfig StorePool::config() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->config;
}

} // namespace waypoint::store
