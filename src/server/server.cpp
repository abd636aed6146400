/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Server implementation - Async I/O foundation with graceful shutdown
 */

#include "server/server.hpp"
#include "server/session.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <csignal>
#include <stdexcept>

namespace waypoint::server {

namespace {

constexpr auto kComponent = util::log_component::Server;

} // anonymous namespace

Server::Server(const ServerConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(std::max<std::size_t>(config.thread_count, 1)))
    , work_guard_(asio::make_work_guard(io_context_))
    , http_acceptor_(io_context_)
    , https_acceptor_(io_context_)
    , signals_(io_context_)
{
    config_.thread_count = std::max<std::size_t>(config_.thread_count, 1);
    WAYPOINT_LOG_DEBUG(kComponent, "Initializing with {} threads on {}", config_.thread_count, config_.bind_address);
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(RequestHandler handler, TlsContextManager* tls, ReloadHandler reload_handler) {
    if (running_.exchange(true)) {
        WAYPOINT_LOG_WARN(kComponent, "Already running, ignoring start request");
        return;
    }

    request_handler_ = std::move(handler);
    tls_ = tls;
    reload_handler_ = std::move(reload_handler);

    try {
        open_acceptor(http_acceptor_, config_.http_port, "HTTP");
        http_port_ = http_acceptor_.local_endpoint().port();

        if (tls_) {
            open_acceptor(https_acceptor_, config_.https_port, "HTTPS");
            https_port_ = https_acceptor_.local_endpoint().port();
        }
    } catch (...) {
        running_ = false;
        boost::system::error_code ec;
        http_acceptor_.close(ec);
        https_acceptor_.close(ec);
        throw;
    }

    if (config_.handle_signals) {
        setup_signal_handling();
        wait_for_signal();
    }

    do_accept_http();
    if (tls_) {
        do_accept_https();
    }

    // Worker ids start at 1 so that 0 means "not a worker"
    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        auto worker_id = static_cast<std::uint32_t>(i + 1);
        thread_pool_.emplace_back([this, worker_id](std::stop_token st) {
            run_io_context(st, worker_id);
        });
    }

    WAYPOINT_LOG_INFO(kComponent, "Started with {} worker threads", config_.thread_count);
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }

    WAYPOINT_LOG_INFO(kComponent, "Initiating graceful shutdown...");

    boost::system::error_code ec;
    http_acceptor_.close(ec);
    if (ec) {
        WAYPOINT_LOG_WARN(kComponent, "Error closing HTTP acceptor: {}", ec.message());
    }
    https_acceptor_.close(ec);

    signals_.cancel(ec);

    // Release the work guard to allow io_context to complete
    work_guard_.reset();

    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }

    // Stop io_context (interrupts any waiting async operations)
    io_context_.stop();
}

void Server::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
    thread_pool_.clear();
    WAYPOINT_LOG_DEBUG(kComponent, "All worker threads terminated");
}

bool Server::is_running() const noexcept {
    return running_.load();
}

asio::io_context& Server::get_io_context() noexcept {
    return io_context_;
}

std::uint16_t Server::get_http_port() const noexcept {
    return http_port_.load();
}

std::uint16_t Server::get_https_port() const noexcept {
    return https_port_.load();
}

std::uint64_t Server::connections_accepted() const noexcept {
    return connection_sequence_.load();
}

void Server::run_io_context(std::stop_token stop_token, std::uint32_t worker_id) {
    set_current_worker_id(worker_id);
    WAYPOINT_LOG_DEBUG(kComponent, "Worker thread {} started", worker_id);

    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break; // Normal exit when io_context runs out of work or is stopped
        } catch (const std::exception& e) {
            WAYPOINT_LOG_ERROR(kComponent, "Exception in worker thread {}: {}", worker_id, e.what());
        }
    }

    WAYPOINT_LOG_DEBUG(kComponent, "Worker thread {} exiting", worker_id);
}

void Server::open_acceptor(tcp::acceptor& acceptor, std::uint16_t port, const char* name) {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, port);

    acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error(std::string("Failed to open ") + name + " acceptor: " + ec.message());
    }

    acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        WAYPOINT_LOG_WARN(kComponent, "Failed to set reuse_address on {} acceptor: {}", name, ec.message());
    }

    acceptor.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error(std::string("Failed to bind ") + name + " listener to " +
                                 config_.bind_address + ":" + std::to_string(port) + ": " + ec.message());
    }

    acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error(std::string("Failed to listen on ") + name + " acceptor: " + ec.message());
    }

    WAYPOINT_LOG_INFO(kComponent, "{} listening on {}:{}", name, config_.bind_address,
                      acceptor.local_endpoint().port());
}

bool Server::accept_failed(boost::system::error_code ec, const char* name) {
    if (!ec) {
        return false;
    }
    if (ec != asio::error::operation_aborted) {
        WAYPOINT_LOG_ERROR(kComponent, "{} accept error: {}", name, ec.message());
    }
    return true;
}

std::uint64_t Server::next_connection_id() noexcept {
    return connection_sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
}

void Server::do_accept_http() {
    // Each connection gets its own strand
    http_acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (!accept_failed(ec, "HTTP")) {
                auto info = describe_connection(socket, next_connection_id());
                WAYPOINT_LOG_DEBUG(kComponent, "Connection #{} accepted from {}:{}",
                                   info.connection_id, info.client_ip, info.client_port);
                std::make_shared<PlainSession>(std::move(socket), request_handler_, std::move(info))->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            }

            do_accept_http();
        }
    );
}

void Server::do_accept_https() {
    https_acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (!accept_failed(ec, "HTTPS")) {
                auto info = describe_connection(socket, next_connection_id());
                WAYPOINT_LOG_DEBUG(kComponent, "TLS connection #{} accepted from {}:{}",
                                   info.connection_id, info.client_ip, info.client_port);
                std::make_shared<TlsSession>(std::move(socket), *tls_,
                                             request_handler_, std::move(info))->start();
            } else if (ec == asio::error::operation_aborted) {
                return;
            }

            do_accept_https();
        }
    );
}

void Server::setup_signal_handling() {
    // SIGINT/SIGTERM shut down, SIGHUP reloads configuration
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.add(SIGHUP);
}

void Server::wait_for_signal() {
    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                WAYPOINT_LOG_DEBUG(kComponent, "Signal handler error: {}", ec.message());
            }
            return;
        }

        // SIGHUP triggers config reload, not shutdown
        if (signal_number == SIGHUP) {
            WAYPOINT_LOG_INFO(kComponent, "Received SIGHUP - reloading configuration");
            if (reload_handler_) {
                try {
                    reload_handler_();
                } catch (const std::exception& e) {
                    WAYPOINT_LOG_ERROR(kComponent, "Config reload failed: {}", e.what());
                }
            } else {
                WAYPOINT_LOG_WARN(kComponent, "No reload handler configured, ignoring SIGHUP");
            }
            wait_for_signal();
            return;
        }

        WAYPOINT_LOG_INFO(kComponent, "Received signal {} - initiating shutdown", signal_number);
        stop();
    });
}

} // namespace waypoint::server
