/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Redis Client - Pipelined RESP2 client with per-operation deadlines over Boost.Beast
 */

#ifndef WAYPOINT_STORE_REDIS_CLIENT_HPP
#define WAYPOINT_STORE_REDIS_CLIENT_HPP

#include "store/resp.hpp"
#include "store/store_client.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace waypoint::store {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

/**
 * Connection settings for one Redis client
 */
struct RedisConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{6379};
    std::string password;                       // AUTH on connect when non-empty
    int database{0};                            // SELECT on connect when non-zero
    std::chrono::milliseconds timeout{1000};    // Bound on every connect/write/read
};

/**
 * Redis client - one TCP connection driven on the caller's executor
 *
 * The connection is opened lazily by the first batch; AUTH and SELECT are
 * pipelined ahead of that batch's commands. A stalled store surfaces as a
 * StoreError once the deadline passes. After any failure the connection is
 * closed and is_open() is false.
 */
class RedisClient : public StoreClient {
public:
    RedisClient(asio::any_io_executor executor, const RedisConfig& config);
    ~RedisClient() override;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    void async_execute(std::vector<Command> commands, ReplyHandler handler) override;

    bool is_open() override;

    const RedisConfig& config() const noexcept { return config_; }

private:
    void do_resolve();
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(beast::error_code ec);
    void do_write();
    void on_write(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    /**
     * Move every complete reply from the read buffer into replies_
     * @throws resp::ProtocolError on malformed input
     */
    void consume_replies();
    void finish();
    void fail(const std::string& what, beast::error_code ec);
    void complete(std::exception_ptr error);

    RedisConfig config_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;

    std::string write_buffer_;
    std::string read_buffer_;
    std::array<char, 4096> chunk_{};

    std::vector<std::string> setup_commands_;   // AUTH/SELECT sent ahead of the first batch
    std::size_t expected_replies_{0};
    std::vector<resp::Value> replies_;
    ReplyHandler handler_;

    bool connected_{false};
    bool broken_{false};
};

} // namespace waypoint::store

#endif // WAYPOINT_STORE_REDIS_CLIENT_HPP
