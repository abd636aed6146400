/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Server component - Async I/O foundation with HTTP/HTTPS listeners and graceful shutdown
 */

#ifndef WAYPOINT_SERVER_SERVER_HPP
#define WAYPOINT_SERVER_SERVER_HPP

#include "server/http_message.hpp"
#include "server/tls_context.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace waypoint::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * Server configuration for the listeners and worker pool
 */
struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t http_port{8080};          // 0 picks an ephemeral port
    std::uint16_t https_port{8443};         // Used only when a TLS context is given
    std::size_t thread_count{std::thread::hardware_concurrency()};
    bool handle_signals{true};              // SIGINT/SIGTERM stop, SIGHUP reloads
};

/**
 * Reload handler type - called on SIGHUP
 */
using ReloadHandler = std::function<void()>;

/**
 * Main server class - manages io_context, worker threads and TCP acceptors
 *
 * Each worker thread carries a stable worker id (1..thread_count). Both
 * listeners draw connection ids from one process-wide sequence.
 * Uses std::jthread with stop_token for graceful shutdown.
 */
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    // Non-copyable, non-movable (owns threads and io_context)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * Start the server - begins accepting connections
     * @param handler Request handler shared by both listeners
     * @param tls TLS context; the HTTPS listener is opened only when non-null
     * @param reload_handler Invoked on SIGHUP
     * @throws std::runtime_error if a listener cannot be opened
     */
    void start(RequestHandler handler,
               TlsContextManager* tls = nullptr,
               ReloadHandler reload_handler = nullptr);

    /**
     * Request graceful shutdown
     * Stops accepting new connections and stops the worker threads.
     */
    void stop();

    /**
     * Block until all worker threads have exited
     */
    void wait();

    bool is_running() const noexcept;

    asio::io_context& get_io_context() noexcept;

    /**
     * Bound HTTP port (resolves an ephemeral port after start)
     */
    std::uint16_t get_http_port() const noexcept;

    /**
     * Bound HTTPS port, 0 when the HTTPS listener is not open
     */
    std::uint16_t get_https_port() const noexcept;

    std::uint64_t connections_accepted() const noexcept;

private:
    void run_io_context(std::stop_token stop_token, std::uint32_t worker_id);
    void open_acceptor(tcp::acceptor& acceptor, std::uint16_t port, const char* name);
    void do_accept_http();
    void do_accept_https();
    bool accept_failed(boost::system::error_code ec, const char* name);
    std::uint64_t next_connection_id() noexcept;
    void setup_signal_handling();
    void wait_for_signal();

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor http_acceptor_;
    tcp::acceptor https_acceptor_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    RequestHandler request_handler_;
    TlsContextManager* tls_{nullptr};
    ReloadHandler reload_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> http_port_{0};
    std::atomic<std::uint16_t> https_port_{0};
    std::atomic<std::uint64_t> connection_sequence_{0};
};

} // namespace waypoint::server

#endif // WAYPOINT_SERVER_SERVER_HPP
