/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Logger - Component-tagged logging with spdlog
 *
 * Provides:
 * - Leveled logging tagged with the emitting component
 * - Access log: request id, client, method, path, status, latency, route, upstream
 * - Console output with optional colors, optional rotating log file
 * - Request id generation for X-Request-ID propagation
 */

#ifndef WAYPOINT_UTIL_LOGGER_HPP
#define WAYPOINT_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace waypoint::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Access log entry for one decided request
 */
struct AccessLogEntry {
    std::string request_id;
    std::string client_ip;
    std::string method;
    std::string path;
    int status_code{0};
    std::chrono::microseconds latency{0};
    std::string route_id;
    std::string upstream;   // "address:port" or empty
};

/**
 * Logger - process-wide logging with component tagging
 *
 * Thread-safe singleton. The first call to init() or instance() configures it;
 * set_level() may be called at any time (hot reload).
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Must be called before any logging occurs to take effect
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Log one access line for a handled request
     */
    void access(const AccessLogEntry& entry);

    /**
     * Flush all sinks and drop registered loggers
     */
    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = fmt::format("[{}] {}", component, msg);

        switch (level) {
            case LogLevel::Trace:    logger_->trace(full_msg); break;
            case LogLevel::Debug:    logger_->debug(full_msg); break;
            case LogLevel::Info:     logger_->info(full_msg); break;
            case LogLevel::Warn:     logger_->warn(full_msg); break;
            case LogLevel::Error:    logger_->error(full_msg); break;
            case LogLevel::Critical: logger_->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Generate a random 16-hex-digit request id
 */
std::string generate_request_id();

#define WAYPOINT_LOG_TRACE(component, ...) \
    ::waypoint::util::Logger::instance().trace(component, __VA_ARGS__)
#define WAYPOINT_LOG_DEBUG(component, ...) \
    ::waypoint::util::Logger::instance().debug(component, __VA_ARGS__)
#define WAYPOINT_LOG_INFO(component, ...) \
    ::waypoint::util::Logger::instance().info(component, __VA_ARGS__)
#define WAYPOINT_LOG_WARN(component, ...) \
    ::waypoint::util::Logger::instance().warn(component, __VA_ARGS__)
#define WAYPOINT_LOG_ERROR(component, ...) \
    ::waypoint::util::Logger::instance().error(component, __VA_ARGS__)
#define WAYPOINT_LOG_CRITICAL(component, ...) \
    ::waypoint::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Store = "store";
    constexpr std::string_view Router = "router";
    constexpr std::string_view Balancer = "balancer";
    constexpr std::string_view TLS = "tls";
    constexpr std::string_view Acme = "acme";
    constexpr std::string_view Pipeline = "pipeline";
}

} // namespace waypoint::util

#endif // WAYPOINT_UTIL_LOGGER_HPP
