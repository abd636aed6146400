/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * TLS Context - TLS configuration, optional default certificate and per-handshake certificate lookup
 */

#ifndef WAYPOINT_SERVER_TLS_CONTEXT_HPP
#define WAYPOINT_SERVER_TLS_CONTEXT_HPP

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <filesystem>
#include <functional>
#include <string>

namespace waypoint::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;

/**
 * TLS configuration
 */
struct TlsConfig {
    std::filesystem::path default_cert_file;    // Optional fallback certificate (PEM)
    std::filesystem::path default_key_file;     // Optional fallback key (PEM)

    // TLS version settings
    bool enable_tls_1_2{true};
    bool enable_tls_1_3{true};

    // Optional: Cipher suite configuration (OpenSSL cipher string format)
    std::string cipher_list;                // For TLS 1.2
    std::string ciphersuites;               // For TLS 1.3

    // Session caching
    std::size_t session_cache_size{20480};  // Number of cached sessions, 0 disables the cache
};

/**
 * Installs a looked-up certificate on one connection; returns whether it did
 */
using CertificateInstaller = std::function<bool(SSL* ssl)>;

/**
 * Completion of a certificate lookup; an empty installer leaves the
 * connection with the default certificate
 */
using SniCompletion = std::function<void(CertificateInstaller installer)>;

/**
 * Looks up the certificate for a lowercase SNI name
 *
 * Runs before the handshake starts and may complete later, from any thread.
 * The completion must be called exactly once.
 */
using SniResolver = std::function<void(std::string server_name, SniCompletion done)>;

/**
 * TLS Context Manager
 *
 * One server context shared by all TLS sessions. Certificates normally come
 * from the SNI resolver per connection; the default certificate, when
 * configured, is what clients without SNI or without a stored certificate see.
 */
class TlsContextManager {
public:
    /**
     * @throws std::runtime_error if the default certificate/key cannot be loaded
     */
    explicit TlsContextManager(const TlsConfig& config);

    ~TlsContextManager() = default;

    // Non-copyable, non-movable
    TlsContextManager(const TlsContextManager&) = delete;
    TlsContextManager& operator=(const TlsContextManager&) = delete;
    TlsContextManager(TlsContextManager&&) = delete;
    TlsContextManager& operator=(TlsContextManager&&) = delete;

    ssl::context& get_context() noexcept;

    /**
     * Set the per-connection certificate lookup
     */
    void set_sni_resolver(SniResolver resolver);

    const SniResolver& sni_resolver() const noexcept;

    bool has_default_certificate() const noexcept;

    /**
     * Subject of the default certificate, for startup logging
     */
    std::string get_certificate_subject();

private:
    void configure_tls_versions(const TlsConfig& config);
    void configure_ciphers(const TlsConfig& config);
    void load_default_certificate(const TlsConfig& config);

    ssl::context context_;
    SniResolver sni_resolver_;
    bool has_default_certificate_{false};
};

} // namespace waypoint::server

#endif // WAYPOINT_SERVER_TLS_CONTEXT_HPP
