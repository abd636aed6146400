/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * In-memory StoreClient for unit tests
 */

#ifndef WAYPOINT_TESTS_SUPPORT_MEMORY_STORE_HPP
#define WAYPOINT_TESTS_SUPPORT_MEMORY_STORE_HPP

#include "store/keys.hpp"
#include "store/store_client.hpp"
#include "store/store_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::test {

/**
 * Data shared by all clients created from one MemoryStore
 */
struct MemoryStoreData {
    std::map<std::string, std::string> strings;
    std::map<std::string, std::set<std::string>> sets;
    std::map<std::string, std::vector<std::string>> lists;

    bool fail{false};           // Every batch fails with StoreError while set
    std::atomic<std::size_t> calls{0};          // Commands received
    std::atomic<std::uint64_t> epoch{0};

    /**
     * Simulate the server closing every existing connection
     */
    void drop_connections() {
        ++epoch;
    }

    // Helpers for the control-plane key schema

    void add_route(const std::string& host, const std::string& id, const std::string& document) {
        sets[store::keys::route_index(host)].insert(id);
        strings[store::keys::route(id)] = document;
    }

    void set_upstreams(const std::string& route_id, std::vector<std::string> entries) {
        lists[store::keys::upstreams(route_id)] = std::move(entries);
    }

    void mark_unhealthy(const std::string& route_id, const std::string& address, std::uint16_t port) {
        strings[store::keys::upstream_health(route_id, address, port)] = "unhealthy";
    }
};

/**
 * Store client over MemoryStoreData
 *
 * Batches complete inline, before async_execute returns.
 */
class MemoryStore : public store::StoreClient {
public:
    MemoryStore() : data_(std::make_shared<MemoryStoreData>()), epoch_(data_->epoch.load()) {}
    explicit MemoryStore(std::shared_ptr<MemoryStoreData> data)
        : data_(std::move(data)), epoch_(data_->epoch.load()) {}

    MemoryStoreData& data() { return *data_; }
    std::shared_ptr<MemoryStoreData> shared_data() const { return data_; }

    void async_execute(std::vector<store::Command> commands, store::ReplyHandler handler) override {
        data_->calls += commands.size();
        if (data_->fail) {
            handler(std::make_exception_ptr(store::StoreError("memory store unavailable")), {});
            return;
        }

        std::vector<store::resp::Value> replies;
        replies.reserve(commands.size());
        for (const auto& command : commands) {
            replies.push_back(execute(command));
        }
        handler(nullptr, std::move(replies));
    }

    bool is_open() override {
        return epoch_ == data_->epoch.load();
    }

private:
    store::resp::Value execute(const store::Command& command) const {
        const auto& name = command.at(0);
        if (name == "GET") {
            auto it = data_->strings.find(command.at(1));
            return it == data_->strings.end() ? null() : bulk(it->second);
        }
        if ((name == "SMEMBERS" || name == "LRANGE") && data_->strings.count(command.at(1))) {
            return wrong_type();
        }
        if (name == "SMEMBERS") {
            auto it = data_->sets.find(command.at(1));
            if (it == data_->sets.end()) {
                return array({});
            }
            // Reverse order so callers cannot rely on store ordering
            return array(std::vector<std::string>(it->second.rbegin(), it->second.rend()));
        }
        if (name == "LRANGE") {
            auto it = data_->lists.find(command.at(1));
            if (it == data_->lists.end()) {
                return array({});
            }
            const auto& list = it->second;
            auto size = static_cast<long>(list.size());
            long start = std::stol(command.at(2));
            long stop = std::stol(command.at(3));
            if (start < 0) start = std::max(0L, size + start);
            if (stop < 0) stop = size + stop;
            stop = std::min(stop, size - 1);
            if (start > stop) {
                return array({});
            }
            return array(std::vector<std::string>(list.begin() + start, list.begin() + stop + 1));
        }
        if (name == "PING") {
            store::resp::Value pong;
            pong.type = store::resp::Type::simple_string;
            pong.str = "PONG";
            return pong;
        }

        store::resp::Value error;
        error.type = store::resp::Type::error;
        error.str = "ERR unknown command '" + name + "'";
        return error;
    }

    static store::resp::Value wrong_type() {
        store::resp::Value error;
        error.type = store::resp::Type::error;
        error.str = "WRONGTYPE Operation against a key holding the wrong kind of value";
        return error;
    }

    static store::resp::Value null() {
        return store::resp::Value{};
    }

    static store::resp::Value bulk(const std::string& value) {
        store::resp::Value reply;
        reply.type = store::resp::Type::bulk_string;
        reply.str = value;
        return reply;
    }

    static store::resp::Value array(const std::vector<std::string>& values) {
        store::resp::Value reply;
        reply.type = store::resp::Type::array;
        for (const auto& value : values) {
            reply.elements.push_back(bulk(value));
        }
        return reply;
    }

    std::shared_ptr<MemoryStoreData> data_;
    std::uint64_t epoch_;
};

inline store::StorePoolConfig memory_pool_config() {
    store::StorePoolConfig config;
    config.max_idle = 4;
    return config;
}

/**
 * Client factory whose clients all share one MemoryStoreData
 */
inline store::ClientFactory memory_factory(std::shared_ptr<MemoryStoreData> data) {
    return [data](const store::RedisConfig&) -> std::unique_ptr<store::StoreClient> {
        if (data->fail) {
            throw store::StoreError("memory store unreachable");
        }
        return std::make_unique<MemoryStore>(data);
    };
}

} // namespace waypoint::test

#endif // WAYPOINT_TESTS_SUPPORT_MEMORY_STORE_HPP
