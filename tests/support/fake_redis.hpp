/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * In-process fake Redis server for client, pool and pipeline tests
 */

#ifndef WAYPOINT_TESTS_SUPPORT_FAKE_REDIS_HPP
#define WAYPOINT_TESTS_SUPPORT_FAKE_REDIS_HPP

#include "store/redis_client.hpp"
#include "store/resp.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace waypoint::test {

/**
 * Blocking single-threaded fake that serves a fixed number of connections,
 * one after the other.
 * The handler returns the raw RESP reply; an empty reply sends nothing.
 * With replies_per_connection set, the server closes each connection after
 * that many replies.
 */
class FakeRedis {
public:
    using Handler = std::function<std::string(const store::Command&)>;

    explicit FakeRedis(Handler handler, int connections = 1, std::size_t replies_per_connection = 0)
        : handler_(std::move(handler))
        , acceptor_(io_, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
        , replies_per_connection_(replies_per_connection)
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, connections] { serve(connections); });
    }

    ~FakeRedis() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    FakeRedis(const FakeRedis&) = delete;
    FakeRedis& operator=(const FakeRedis&) = delete;

    std::uint16_t port() const { return port_; }

    std::vector<store::Command> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    /**
     * Connections the server itself has closed
     */
    std::size_t closed_connections() const { return closed_.load(); }

    /**
     * Block until the server has closed count connections, then give the
     * client's kernel a moment to see the FIN
     */
    bool wait_for_close(std::size_t count, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) const {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (closed_.load() < count) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return true;
    }

private:
    void serve(int connections) {
        for (int i = 0; i < connections; ++i) {
            boost::asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec) {
                return;
            }
            serve_connection(socket);
        }
    }

    void serve_connection(boost::asio::ip::tcp::socket& socket) {
        std::string buffer;
        std::array<char, 1024> chunk{};
        std::size_t replies = 0;
        boost::system::error_code ec;

        for (;;) {
            std::size_t n = socket.read_some(boost::asio::buffer(chunk), ec);
            if (ec) {
                return;
            }
            buffer.append(chunk.data(), n);

            std::size_t consumed = 0;
            while (auto request = store::resp::parse(buffer, consumed)) {
                buffer.erase(0, consumed);

                store::Command command;
                for (const auto& element : request->elements) {
                    command.push_back(element.str);
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    commands_.push_back(command);
                }

                std::string reply = handler_(command);
                if (reply.empty()) {
                    continue;
                }
                boost::asio::write(socket, boost::asio::buffer(reply), ec);
                if (ec) {
                    return;
                }

                if (replies_per_connection_ > 0 && ++replies >= replies_per_connection_) {
                    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
                    socket.close(ec);
                    ++closed_;
                    return;
                }
            }
        }
    }

    Handler handler_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::size_t replies_per_connection_;
    std::uint16_t port_{0};
    std::thread thread_;
    std::atomic<std::size_t> closed_{0};

    mutable std::mutex mutex_;
    std::vector<store::Command> commands_;
};

inline std::string resp_bulk(const std::string& value) {
    return "$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
}

inline std::string resp_array(const std::vector<std::string>& values) {
    std::string out = "*" + std::to_string(values.size()) + "\r\n";
    for (const auto& value : values) {
        out += resp_bulk(value);
    }
    return out;
}

inline store::RedisConfig fake_redis_config(std::uint16_t port) {
    store::RedisConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = std::chrono::milliseconds(1000);
    return config;
}

} // namespace waypoint::test

#endif // WAYPOINT_TESTS_SUPPORT_FAKE_REDIS_HPP
