/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Redis Client Implementation
 */

#include "store/redis_client.hpp"
#include "util/logger.hpp"

#include <cstddef>
#include <utility>

namespace waypoint::store {

using util::log_component::Store;

RedisClient::RedisClient(asio::any_io_executor executor, const RedisConfig& config)
    : config_(config)
    , resolver_(executor)
    , stream_(executor)
{
}

RedisClient::~RedisClient() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
}

bool RedisClient::is_open() {
    if (broken_) {
        return false;
    }
    if (!connected_) {
        return true;    // Connects on first use
    }

    auto& socket = stream_.socket();
    if (!socket.is_open()) {
        return false;
    }

    // Non-blocking peek: an idle connection must have nothing to read
    beast::error_code ec;
    socket.non_blocking(true, ec);
    if (ec) {
        return false;
    }

    char peek_buf[1];
    socket.receive(asio::buffer(peek_buf), tcp::socket::message_peek, ec);

    beast::error_code restore_ec;
    socket.non_blocking(false, restore_ec);

    if (ec == asio::error::would_block) {
        return true;
    }

    // EOF or reset means the server closed it; data means a stray reply
    WAYPOINT_LOG_DEBUG(Store, "Idle connection to {}:{} is no longer usable ({})",
                       config_.host, config_.port, ec ? ec.message() : std::string("unexpected data"));
    broken_ = true;
    return false;
}

void RedisClient::async_execute(std::vector<Command> commands, ReplyHandler handler) {
    if (broken_ || commands.empty()) {
        std::exception_ptr error;
        if (broken_) {
            error = std::make_exception_ptr(StoreError("Redis connection is closed"));
        }
        asio::post(stream_.get_executor(), [handler = std::move(handler), error]() {
            handler(error, {});
        });
        return;
    }

    handler_ = std::move(handler);
    replies_.clear();
    write_buffer_.clear();

    if (!connected_) {
        setup_commands_.clear();
        if (!config_.password.empty()) {
            write_buffer_ += resp::encode_command({"AUTH", config_.password});
            setup_commands_.push_back("AUTH");
        }
        if (config_.database != 0) {
            auto db = std::to_string(config_.database);
            write_buffer_ += resp::encode_command({"SELECT", db});
            setup_commands_.push_back("SELECT " + db);
        }
    }

    write_buffer_ += resp::encode_commands(commands);
    expected_replies_ = setup_commands_.size() + commands.size();
    replies_.reserve(expected_replies_);

    if (connected_) {
        do_write();
    } else {
        do_resolve();
    }
}

void RedisClient::do_resolve() {
    resolver_.async_resolve(
        config_.host,
        std::to_string(config_.port),
        [this](beast::error_code ec, tcp::resolver::results_type results) {
            on_resolve(ec, std::move(results));
        });
}

void RedisClient::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        fail("resolve " + config_.host, ec);
        return;
    }

    stream_.expires_after(config_.timeout);
    stream_.async_connect(
        results,
        [this](beast::error_code connect_ec, const tcp::endpoint&) {
            on_connect(connect_ec);
        });
}

void RedisClient::on_connect(beast::error_code ec) {
    if (ec) {
        fail("connect " + config_.host + ":" + std::to_string(config_.port), ec);
        return;
    }

    beast::error_code option_ec;
    stream_.socket().set_option(tcp::no_delay(true), option_ec);
    connected_ = true;

    WAYPOINT_LOG_DEBUG(Store, "Connected to {}:{} (db={})", config_.host, config_.port, config_.database);
    do_write();
}

void RedisClient::do_write() {
    stream_.expires_after(config_.timeout);
    asio::async_write(
        stream_,
        asio::buffer(write_buffer_),
        [this](beast::error_code ec, std::size_t) {
            on_write(ec);
        });
}

void RedisClient::on_write(beast::error_code ec) {
    if (ec) {
        fail("write", ec);
        return;
    }
    do_read();
}

void RedisClient::do_read() {
    stream_.expires_after(config_.timeout);
    stream_.async_read_some(
        asio::buffer(chunk_),
        [this](beast::error_code ec, std::size_t bytes_transferred) {
            on_read(ec, bytes_transferred);
        });
}

void RedisClient::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        fail("read", ec);
        return;
    }

    read_buffer_.append(chunk_.data(), bytes_transferred);

    std::exception_ptr protocol_error;
    try {
        consume_replies();
    } catch (const resp::ProtocolError&) {
        protocol_error = std::current_exception();
    }

    if (protocol_error) {
        broken_ = true;
        stream_.close();
        complete(protocol_error);
        return;
    }

    if (replies_.size() < expected_replies_) {
        do_read();
        return;
    }
    finish();
}

void RedisClient::consume_replies() {
    while (replies_.size() < expected_replies_) {
        std::size_t consumed = 0;
        auto reply = resp::parse(read_buffer_, consumed);
        if (!reply) {
            return;
        }
        read_buffer_.erase(0, consumed);
        replies_.push_back(std::move(*reply));
    }
}

void RedisClient::finish() {
    for (std::size_t i = 0; i < setup_commands_.size(); ++i) {
        if (replies_[i].is_error()) {
            broken_ = true;
            stream_.close();
            complete(std::make_exception_ptr(
                StoreError("Redis " + setup_commands_[i] + " rejected: " + replies_[i].str)));
            return;
        }
    }

    replies_.erase(replies_.begin(), replies_.begin() + static_cast<std::ptrdiff_t>(setup_commands_.size()));
    setup_commands_.clear();

    // Bytes past the last expected reply would be read as the next batch's replies
    if (!read_buffer_.empty()) {
        broken_ = true;
    }

    complete(nullptr);
}

void RedisClient::fail(const std::string& what, beast::error_code ec) {
    broken_ = true;
    stream_.close();

    std::string message = ec == beast::error::timeout
        ? "Redis " + what + " timed out after " + std::to_string(config_.timeout.count()) + "ms"
        : "Redis " + what + " failed: " + ec.message();
    WAYPOINT_LOG_DEBUG(Store, "{}", message);

    complete(std::make_exception_ptr(StoreError(message)));
}

void RedisClient::complete(std::exception_ptr error) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    auto replies = std::move(replies_);
    replies_.clear();

    // The handler may release and destroy this client; no member access after it
    handler(error, std::move(replies));
}

} // namespace waypoint::store
