/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * TLS Context implementation
 */

#include "server/tls_context.hpp"
#include "util/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <stdexcept>

namespace waypoint::server {

using util::log_component::TLS;

namespace {

std::string get_ssl_error_string() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return std::string(buf);
}

} // anonymous namespace

TlsContextManager::TlsContextManager(const TlsConfig& config)
    : context_(ssl::context::tls_server) {
    configure_tls_versions(config);
    configure_ciphers(config);

    // Clients are not verified
    context_.set_verify_mode(ssl::verify_none);

    if (config.session_cache_size > 0) {
        SSL_CTX* ssl_ctx = context_.native_handle();
        SSL_CTX_set_session_cache_mode(ssl_ctx, SSL_SESS_CACHE_SERVER);
        SSL_CTX_sess_set_cache_size(ssl_ctx, static_cast<long>(config.session_cache_size));
        WAYPOINT_LOG_DEBUG(TLS, "Session cache enabled (size={})", config.session_cache_size);
    }

    load_default_certificate(config);

    WAYPOINT_LOG_INFO(TLS, "TLS context initialized (default certificate: {})",
                      has_default_certificate_ ? get_certificate_subject() : std::string("none"));
}

ssl::context& TlsContextManager::get_context() noexcept {
    return context_;
}

void TlsContextManager::set_sni_resolver(SniResolver resolver) {
    sni_resolver_ = std::move(resolver);
}

const SniResolver& TlsContextManager::sni_resolver() const noexcept {
    return sni_resolver_;
}

bool TlsContextManager::has_default_certificate() const noexcept {
    return has_default_certificate_;
}

std::string TlsContextManager::get_certificate_subject() {
    X509* cert = SSL_CTX_get0_certificate(context_.native_handle());
    if (!cert) {
        return "(no certificate loaded)";
    }

    char buf[256];
    X509_NAME_oneline(X509_get_subject_name(cert), buf, sizeof(buf));
    return std::string(buf);
}

void TlsContextManager::configure_tls_versions(const TlsConfig& config) {
    SSL_CTX* ssl_ctx = context_.native_handle();

    if (config.enable_tls_1_2 && config.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
    } else if (config.enable_tls_1_3) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_3_VERSION);
    } else if (config.enable_tls_1_2) {
        SSL_CTX_set_min_proto_version(ssl_ctx, TLS1_2_VERSION);
        SSL_CTX_set_max_proto_version(ssl_ctx, TLS1_2_VERSION);
    } else {
        throw std::runtime_error("At least one TLS version must be enabled");
    }

    context_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1 |
                         ssl::context::single_dh_use);
}

void TlsContextManager::configure_ciphers(const TlsConfig& config) {
    SSL_CTX* ssl_ctx = context_.native_handle();

    std::string cipher_list = config.cipher_list;
    if (cipher_list.empty()) {
        cipher_list = "ECDHE+AESGCM:DHE+AESGCM:ECDHE+CHACHA20:DHE+CHACHA20:"
                      "ECDHE+AES256:DHE+AES256:ECDHE+AES128:DHE+AES128:"
                      "!aNULL:!eNULL:!EXPORT:!DES:!RC4:!3DES:!MD5:!PSK";
    }
    if (SSL_CTX_set_cipher_list(ssl_ctx, cipher_list.c_str()) != 1) {
        WAYPOINT_LOG_WARN(TLS, "Failed to set TLS 1.2 cipher list, using defaults");
    }

    std::string ciphersuites = config.ciphersuites;
    if (ciphersuites.empty()) {
        ciphersuites = "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256:"
                       "TLS_AES_128_GCM_SHA256";
    }
    if (SSL_CTX_set_ciphersuites(ssl_ctx, ciphersuites.c_str()) != 1) {
        WAYPOINT_LOG_WARN(TLS, "Failed to set TLS 1.3 ciphersuites, using defaults");
    }
}

void TlsContextManager::load_default_certificate(const TlsConfig& config) {
    if (config.default_cert_file.empty() && config.default_key_file.empty()) {
        WAYPOINT_LOG_INFO(TLS, "No default certificate; handshakes without a stored certificate will fail");
        return;
    }

    boost::system::error_code ec;
    context_.use_certificate_chain_file(config.default_cert_file.string(), ec);
    if (ec) {
        throw std::runtime_error("Failed to load certificate: " + config.default_cert_file.string() +
                                 " - " + ec.message() + " (" + get_ssl_error_string() + ")");
    }

    context_.use_private_key_file(config.default_key_file.string(), ssl::context::pem, ec);
    if (ec) {
        throw std::runtime_error("Failed to load private key: " + config.default_key_file.string() +
                                 " - " + ec.message() + " (" + get_ssl_error_string() + ")");
    }

    has_default_certificate_ = true;
    WAYPOINT_LOG_INFO(TLS, "Loaded default certificate from {}", config.default_cert_file.string());
}

} // namespace waypoint::server
