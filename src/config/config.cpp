/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "util/logger.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace waypoint::config {

namespace {

template<typename T>
T parse_number(const std::string& value, const std::string& what) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        throw std::runtime_error("Invalid " + what + " value: " + value);
    }
    return result;
}

bool parse_flag(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

/**
 * Match "--name VALUE" or "--name=VALUE" at argv[i], advancing i past a
 * separate value
 */
std::optional<std::string> option_value(int argc, char* argv[], int& i,
                                        std::initializer_list<std::string_view> names) {
    std::string_view arg(argv[i]);
    for (auto name : names) {
        if (arg == name && i + 1 < argc) {
            return std::string(argv[++i]);
        }
        if (arg.size() > name.size() && arg.starts_with(name) && arg[name.size()] == '=') {
            return std::string(arg.substr(name.size() + 1));
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"bind_address", s.bind_address},
        {"http_port", s.http_port},
        {"https_port", s.https_port},
        {"threads", s.threads}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
    if (j.contains("http_port")) j.at("http_port").get_to(s.http_port);
    if (j.contains("https_port")) j.at("https_port").get_to(s.https_port);
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
}

void to_json(nlohmann::json& j, const StoreSettings& s) {
    j = nlohmann::json{
        {"host", s.host},
        {"port", s.port},
        {"password", s.password},
        {"database", s.database},
        {"timeout_ms", s.timeout_ms},
        {"pool_size", s.pool_size},
        {"idle_timeout_ms", s.idle_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, StoreSettings& s) {
    if (j.contains("host")) j.at("host").get_to(s.host);
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("password")) j.at("password").get_to(s.password);
    if (j.contains("database")) j.at("database").get_to(s.database);
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(s.timeout_ms);
    if (j.contains("pool_size")) j.at("pool_size").get_to(s.pool_size);
    if (j.contains("idle_timeout_ms")) j.at("idle_timeout_ms").get_to(s.idle_timeout_ms);
}

void to_json(nlohmann::json& j, const TlsSettings& t) {
    j = nlohmann::json{
        {"enabled", t.enabled},
        {"default_cert_file", t.default_cert_file},
        {"default_key_file", t.default_key_file},
        {"session_cache_size", t.session_cache_size}
    };
}

void from_json(const nlohmann::json& j, TlsSettings& t) {
    if (j.contains("enabled")) j.at("enabled").get_to(t.enabled);
    if (j.contains("default_cert_file")) j.at("default_cert_file").get_to(t.default_cert_file);
    if (j.contains("default_key_file")) j.at("default_key_file").get_to(t.default_key_file);
    if (j.contains("session_cache_size")) j.at("session_cache_size").get_to(t.session_cache_size);
}

void to_json(nlohmann::json& j, const BalancerSettings& b) {
    j = nlohmann::json{
        {"reseed_random_per_selection", b.reseed_random_per_selection}
    };
}

void from_json(const nlohmann::json& j, BalancerSettings& b) {
    if (j.contains("reseed_random_per_selection")) {
        j.at("reseed_random_per_selection").get_to(b.reseed_random_per_selection);
    }
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"store", c.store},
        {"tls", c.tls},
        {"balancer", c.balancer},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("store")) j.at("store").get_to(c.store);
    if (j.contains("tls")) j.at("tls").get_to(c.tls);
    if (j.contains("balancer")) j.at("balancer").get_to(c.balancer);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

std::pair<std::string, std::uint16_t> parse_host_port(const std::string& value, const std::string& what) {
    auto colon_pos = value.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("Invalid " + what + " format (expected host:port): " + value);
    }
    auto port = parse_number<std::uint16_t>(value.substr(colon_pos + 1), what + " port");
    return {value.substr(0, colon_pos), port};
}

// Config validation
void Config::validate() const {
    // Validate server settings
    if (server.http_port == 0) {
        throw std::runtime_error("Configuration error: server.http_port must be non-zero");
    }
    if (tls.enabled) {
        if (server.https_port == 0) {
            throw std::runtime_error("Configuration error: server.https_port must be non-zero");
        }
        if (server.http_port == server.https_port) {
            throw std::runtime_error("Configuration error: server.http_port and server.https_port must be different");
        }
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }

    // Validate store settings
    if (store.host.empty()) {
        throw std::runtime_error("Configuration error: store.host cannot be empty");
    }
    if (store.port == 0) {
        throw std::runtime_error("Configuration error: store.port must be non-zero");
    }
    if (store.timeout_ms == 0) {
        throw std::runtime_error("Configuration error: store.timeout_ms must be non-zero");
    }

    // Validate TLS settings
    if (tls.default_cert_file.empty() != tls.default_key_file.empty()) {
        throw std::runtime_error(
            "Configuration error: tls.default_cert_file and tls.default_key_file must be set together");
    }

    // Validate logging settings
    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: logging.level '" + logging.level + "' is not a valid level");
    }

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if (auto value = option_value(argc, argv, i, {"--config", "-c"})) {
            config_path_ = *value;
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    spdlog::info("Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::reload() {
    std::vector<ConfigReloadCallback> callbacks;
    Config reloaded;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);

        if (config_path_.empty()) {
            spdlog::warn("No configuration file specified, reload skipped");
            return;
        }

        spdlog::info("Reloading configuration from {}", config_path_.string());

        auto previous = config_;
        try {
            load_from_file(config_path_);
            apply_environment_overrides();
            reapply_cli_overrides();
            config_.validate();
        } catch (const std::exception& e) {
            spdlog::error("Configuration reload failed: {}", e.what());
            // Keep existing configuration on error
            config_ = std::move(previous);
            return;
        }

        if (config_.store != previous.store) {
            spdlog::info("Store settings changed ({}:{} db={})",
                         config_.store.host, config_.store.port, config_.store.database);
        }

        reloaded = config_;
        callbacks = reload_callbacks_;
    }

    spdlog::info("Configuration reloaded, notifying {} listeners", callbacks.size());
    for (const auto& callback : callbacks) {
        callback(reloaded);
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "Waypoint - Dynamic Reverse Proxy Decision Layer\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --http-port PORT    HTTP listener port (default: 8080)\n"
              << "  --https-port PORT       HTTPS listener port (default: 8443)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  --redis HOST:PORT       Config store address (default: 127.0.0.1:6379)\n"
              << "  --tls                   Enable the HTTPS listener\n"
              << "\n"
              << "Environment Variables:\n"
              << "  WAYPOINT_CONFIG         Path to configuration file\n"
              << "  WAYPOINT_BIND           Bind address\n"
              << "  WAYPOINT_HTTP_PORT      HTTP listener port\n"
              << "  WAYPOINT_HTTPS_PORT     HTTPS listener port\n"
              << "  WAYPOINT_THREADS        Number of I/O threads\n"
              << "  WAYPOINT_REDIS_HOST     Config store host\n"
              << "  WAYPOINT_REDIS_PORT     Config store port\n"
              << "  WAYPOINT_REDIS_PASSWORD Config store password\n"
              << "  WAYPOINT_REDIS_DB       Config store database index\n"
              << "  WAYPOINT_TLS_ENABLED    Enable HTTPS listener (true/false)\n"
              << "  WAYPOINT_LOG_LEVEL      Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  WAYPOINT_LOG_FILE       Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\n"
              << "      \"bind_address\": \"0.0.0.0\",\n"
              << "      \"http_port\": 8080,\n"
              << "      \"https_port\": 8443,\n"
              << "      \"threads\": 4\n"
              << "    },\n"
              << "    \"store\": {\n"
              << "      \"host\": \"127.0.0.1\",\n"
              << "      \"port\": 6379,\n"
              << "      \"password\": \"\",\n"
              << "      \"database\": 0,\n"
              << "      \"timeout_ms\": 1000,\n"
              << "      \"pool_size\": 100,\n"
              << "      \"idle_timeout_ms\": 10000\n"
              << "    },\n"
              << "    \"tls\": {\n"
              << "      \"enabled\": false,\n"
              << "      \"default_cert_file\": \"\",\n"
              << "      \"default_key_file\": \"\",\n"
              << "      \"session_cache_size\": 20480\n"
              << "    },\n"
              << "    \"balancer\": {\n"
              << "      \"reseed_random_per_selection\": true\n"
              << "    },\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\",\n"
              << "      \"max_file_size_mb\": 100,\n"
              << "      \"max_files\": 5,\n"
              << "      \"enable_console\": true,\n"
              << "      \"enable_colors\": true\n"
              << "    }\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload store and log settings without restart.\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("WAYPOINT_CONFIG"); env && !env->empty()) {
            config_path_ = *env;
            load_from_file(config_path_);
        }
    }

    // Server settings
    if (auto env = get_env("WAYPOINT_BIND")) {
        config_.server.bind_address = *env;
        spdlog::debug("Applied WAYPOINT_BIND={}", config_.server.bind_address);
    }

    if (auto env = get_env("WAYPOINT_HTTP_PORT")) {
        config_.server.http_port = parse_number<std::uint16_t>(*env, "WAYPOINT_HTTP_PORT");
        spdlog::debug("Applied WAYPOINT_HTTP_PORT={}", config_.server.http_port);
    }

    if (auto env = get_env("WAYPOINT_HTTPS_PORT")) {
        config_.server.https_port = parse_number<std::uint16_t>(*env, "WAYPOINT_HTTPS_PORT");
        spdlog::debug("Applied WAYPOINT_HTTPS_PORT={}", config_.server.https_port);
    }

    if (auto env = get_env("WAYPOINT_THREADS")) {
        config_.server.threads = parse_number<std::size_t>(*env, "WAYPOINT_THREADS");
        spdlog::debug("Applied WAYPOINT_THREADS={}", config_.server.threads);
    }

    // Store settings
    if (auto env = get_env("WAYPOINT_REDIS_HOST")) {
        config_.store.host = *env;
        spdlog::debug("Applied WAYPOINT_REDIS_HOST={}", config_.store.host);
    }

    if (auto env = get_env("WAYPOINT_REDIS_PORT")) {
        config_.store.port = parse_number<std::uint16_t>(*env, "WAYPOINT_REDIS_PORT");
        spdlog::debug("Applied WAYPOINT_REDIS_PORT={}", config_.store.port);
    }

    if (auto env = get_env("WAYPOINT_REDIS_PASSWORD")) {
        config_.store.password = *env;
        spdlog::debug("Applied WAYPOINT_REDIS_PASSWORD");
    }

    if (auto env = get_env("WAYPOINT_REDIS_DB")) {
        config_.store.database = parse_number<std::uint32_t>(*env, "WAYPOINT_REDIS_DB");
        spdlog::debug("Applied WAYPOINT_REDIS_DB={}", config_.store.database);
    }

    // TLS settings
    if (auto env = get_env("WAYPOINT_TLS_ENABLED")) {
        config_.tls.enabled = parse_flag(*env);
        spdlog::debug("Applied WAYPOINT_TLS_ENABLED={}", config_.tls.enabled);
    }

    // Logging settings
    if (auto env = get_env("WAYPOINT_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied WAYPOINT_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("WAYPOINT_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied WAYPOINT_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);

        // Already handled in the first pass
        if (option_value(argc, argv, i, {"--config", "-c"})) continue;

        if (auto value = option_value(argc, argv, i, {"--http-port", "-p"})) {
            cli_http_port_ = parse_number<std::uint16_t>(*value, "--http-port");
        } else if (auto value = option_value(argc, argv, i, {"--https-port"})) {
            cli_https_port_ = parse_number<std::uint16_t>(*value, "--https-port");
        } else if (auto value = option_value(argc, argv, i, {"--threads", "-t"})) {
            cli_threads_ = parse_number<std::size_t>(*value, "--threads");
        } else if (auto value = option_value(argc, argv, i, {"--bind", "-b"})) {
            cli_bind_address_ = *value;
        } else if (auto value = option_value(argc, argv, i, {"--redis"})) {
            auto [host, port] = parse_host_port(*value, "--redis");
            cli_store_host_ = host;
            cli_store_port_ = port;
        } else if (arg == "--tls") {
            cli_tls_ = true;
        } else {
            spdlog::warn("Ignoring unknown argument: {}", arg);
        }
    }

    reapply_cli_overrides();
}

void ConfigManager::reapply_cli_overrides() {
    if (cli_http_port_) config_.server.http_port = *cli_http_port_;
    if (cli_https_port_) config_.server.https_port = *cli_https_port_;
    if (cli_threads_) config_.server.threads = *cli_threads_;
    if (cli_bind_address_) config_.server.bind_address = *cli_bind_address_;
    if (cli_store_host_) config_.store.host = *cli_store_host_;
    if (cli_store_port_) config_.store.port = *cli_store_port_;
    if (cli_tls_) config_.tls.enabled = true;
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace waypoint::config
