/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (WAYPOINT_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 *
 * Routes, upstreams, certificates and challenges are not configured here; they
 * live in the store and are read per request.
 */

#ifndef WAYPOINT_CONFIG_CONFIG_HPP
#define WAYPOINT_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace waypoint::config {

/**
 * Listener configuration
 */
struct ServerSettings {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t http_port{8080};
    std::uint16_t https_port{8443};
    std::size_t threads{0};  // 0 = hardware_concurrency
};

/**
 * Config store (Redis) connection settings
 */
struct StoreSettings {
    std::string host{"127.0.0.1"};
    std::uint16_t port{6379};
    std::string password;
    std::uint32_t database{0};
    std::uint32_t timeout_ms{1000};         // Per round-trip bound
    std::size_t pool_size{100};             // Idle connections kept per process
    std::uint32_t idle_timeout_ms{10000};

    bool operator==(const StoreSettings&) const = default;
};

/**
 * TLS listener configuration
 */
struct TlsSettings {
    bool enabled{false};
    std::string default_cert_file;          // Presented when no store certificate matches
    std::string default_key_file;
    std::size_t session_cache_size{20480};
};

/**
 * Backend selection settings
 */
struct BalancerSettings {
    bool reseed_random_per_selection{true};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    StoreSettings store;
    TlsSettings tls;
    BalancerSettings balancer;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration reload callback type
 */
using ConfigReloadCallback = std::function<void(const Config&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Reload configuration from file (called on SIGHUP)
     *
     * Store settings and log level take effect live; listener, TLS and
     * balancer settings require a restart. On error the previous
     * configuration is kept.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    /**
     * Get the configuration file path
     */
    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    /**
     * Load configuration from JSON file
     */
    void load_from_file(const std::filesystem::path& path);

    /**
     * Apply environment variable overrides
     */
    void apply_environment_overrides();

    /**
     * Apply command-line argument overrides
     */
    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Re-apply stored CLI overrides after a reload
     */
    void reapply_cli_overrides();

    /**
     * Get environment variable value
     */
    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::uint16_t> cli_http_port_;
    std::optional<std::uint16_t> cli_https_port_;
    std::optional<std::size_t> cli_threads_;
    std::optional<std::string> cli_bind_address_;
    std::optional<std::string> cli_store_host_;
    std::optional<std::uint16_t> cli_store_port_;
    bool cli_tls_{false};
};

/**
 * Parse "host:port" as used by --redis
 * @throws std::runtime_error if the port is missing or invalid
 */
std::pair<std::string, std::uint16_t> parse_host_port(const std::string& value, const std::string& what);

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const StoreSettings& s);
void from_json(const nlohmann::json& j, StoreSettings& s);
void to_json(nlohmann::json& j, const TlsSettings& t);
void from_json(const nlohmann::json& j, TlsSettings& t);
void to_json(nlohmann::json& j, const BalancerSettings& b);
void from_json(const nlohmann::json& j, BalancerSettings& b);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace waypoint::config

#endif // WAYPOINT_CONFIG_CONFIG_HPP
