/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 *
 * Routes HTTP(S) requests by host and path prefix to weighted, health-filtered
 * backend pools held in a Redis config store, picks certificates per TLS
 * handshake and answers ACME HTTP-01 challenges.
 */

#include "balancer/load_balancer.hpp"
#include "certs/certificate_selector.hpp"
#include "config/config.hpp"
#include "proxy/pipeline.hpp"
#include "server/server.hpp"
#include "server/tls_context.hpp"
#include "store/store_pool.hpp"
#include "util/logger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {

waypoint::util::LogConfig to_log_config(const waypoint::config::LogSettings& settings) {
    waypoint::util::LogConfig log_config;
    log_config.level = waypoint::util::Logger::parse_level(settings.level).value_or(waypoint::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

waypoint::store::StorePoolConfig to_pool_config(const waypoint::config::StoreSettings& settings) {
    waypoint::store::StorePoolConfig pool_config;
    pool_config.redis.host = settings.host;
    pool_config.redis.port = settings.port;
    pool_config.redis.password = settings.password;
    pool_config.redis.database = static_cast<int>(settings.database);
    pool_config.redis.timeout = std::chrono::milliseconds(settings.timeout_ms);
    pool_config.max_idle = settings.pool_size;
    pool_config.idle_timeout = std::chrono::milliseconds(settings.idle_timeout_ms);
    return pool_config;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace waypoint;
    using util::log_component::Server;

    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto cfg = config_manager.get_config();

        // The logger is configured once; everything after this logs through it
        util::Logger::init(to_log_config(cfg.logging));
        WAYPOINT_LOG_INFO(Server, "Waypoint reverse proxy decision layer v0.1.0");

        server::ServerConfig server_config;
        server_config.bind_address = cfg.server.bind_address;
        server_config.http_port = cfg.server.http_port;
        server_config.https_port = cfg.server.https_port;
        server_config.thread_count = cfg.server.threads > 0
            ? cfg.server.threads
            : std::max(1u, std::thread::hardware_concurrency());

        WAYPOINT_LOG_INFO(Server, "Configuration: bind={}, http_port={}, https_port={}, threads={}, tls={}",
                          server_config.bind_address, server_config.http_port,
                          cfg.tls.enabled ? std::to_string(server_config.https_port) : std::string("-"),
                          server_config.thread_count, cfg.tls.enabled ? "enabled" : "disabled");

        std::unique_ptr<server::TlsContextManager> tls;
        if (cfg.tls.enabled) {
            server::TlsConfig tls_config;
            tls_config.default_cert_file = cfg.tls.default_cert_file;
            tls_config.default_key_file = cfg.tls.default_key_file;
            tls_config.session_cache_size = cfg.tls.session_cache_size;

            tls = std::make_unique<server::TlsContextManager>(tls_config);
        }

        server::Server server(server_config);

        // Process-wide store pool; its connections run on the server's workers
        store::StorePool store_pool(to_pool_config(cfg.store), server.get_io_context().get_executor());

        balancer::LoadBalancer load_balancer(cfg.balancer);
        proxy::RequestPipeline pipeline(store_pool, load_balancer);
        certs::CertificateSelector certificate_selector(store_pool);

        if (tls) {
            tls->set_sni_resolver([&certificate_selector](std::string server_name, server::SniCompletion done) {
                auto name = server_name;
                certificate_selector.async_select(std::move(server_name),
                    [done = std::move(done), name](std::optional<certs::CertificateMaterial> material) {
                        if (!material) {
                            done(nullptr);
                            return;
                        }
                        done([material = std::move(*material), name](SSL* ssl) {
                            return certs::CertificateSelector::install(ssl, material, name);
                        });
                    });
            });
        }

        // Store settings and log level follow SIGHUP reloads
        config_manager.on_reload([&store_pool](const config::Config& reloaded) {
            store_pool.reconfigure(to_pool_config(reloaded.store));

            if (auto level = util::Logger::parse_level(reloaded.logging.level)) {
                util::Logger::instance().set_level(*level);
            }
            WAYPOINT_LOG_INFO(Server, "Applied reloaded store and log settings");
        });

        server.start(
            [&pipeline](const server::HttpRequest& request, server::ResponseCallback done) {
                pipeline.handle(request, std::move(done));
            },
            tls.get(),
            [&config_manager]() {
                config_manager.reload();
            }
        );

        WAYPOINT_LOG_INFO(Server, "Server started successfully");

        // Wait for shutdown (blocks until signal received)
        server.wait();

        store_pool.close_all();
        WAYPOINT_LOG_INFO(Server, "Server stopped gracefully");
        util::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
