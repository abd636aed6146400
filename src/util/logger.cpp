/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <cctype>
#include <random>
#include <vector>

namespace waypoint::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

void Logger::init(const LogConfig& config) {
    std::call_once(init_flag_, [&config]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
    });
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("waypoint", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Access lines share the sinks but are always emitted at INFO
    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_level(config.level == LogLevel::Off ? spdlog::level::off : spdlog::level::info);

    current_level_.store(config.level, std::memory_order_relaxed);

    spdlog::register_logger(logger_);
    spdlog::register_logger(access_logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    if (access_logger_) {
        access_logger_->set_level(level == LogLevel::Off ? spdlog::level::off : spdlog::level::info);
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

void Logger::access(const AccessLogEntry& entry) {
    if (!access_logger_) return;

    // Format: request_id client_ip "METHOD /path" status latency route upstream
    // Example: 3f9a0c1e22b7d410 10.0.0.7 "GET /api/users" 200 412us web-api 172.18.0.5:3000
    access_logger_->info(
        R"({} {} "{} {}" {} {}us {} {})",
        entry.request_id.empty() ? "-" : entry.request_id,
        entry.client_ip.empty() ? "-" : entry.client_ip,
        entry.method,
        entry.path,
        entry.status_code,
        entry.latency.count(),
        entry.route_id.empty() ? "-" : entry.route_id,
        entry.upstream.empty() ? "-" : entry.upstream
    );
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (access_logger_) {
        access_logger_->flush();
    }
    spdlog::shutdown();
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string id;
    id.reserve(16);

    for (int i = 0; i < 16; ++i) {
        id.push_back(hex_chars[(value >> (i * 4)) & 0xF]);
    }

    return id;
}

} // namespace waypoint::util
