/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Certificate Selector - SNI-driven certificate lookup from the store
 */

#ifndef WAYPOINT_CERTS_CERTIFICATE_SELECTOR_HPP
#define WAYPOINT_CERTS_CERTIFICATE_SELECTOR_HPP

#include "certs/certificate_material.hpp"
#include "routing/host_normalizer.hpp"
#include "store/store_client.hpp"
#include "store/store_pool.hpp"

#include <openssl/ssl.h>

#include <exception>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace waypoint::certs {

/**
 * Certificate document stored under certs:{domain}
 *
 * Material is read from cert_path/key_path, or taken from cert_pem/key_pem
 * when those are present.
 */
struct CertificateRecord {
    std::string domain;
    std::string cert_path;
    std::string key_path;
    std::string cert_pem;
    std::string key_pem;
    std::string expires_at;     // As written by the control plane, informational
    bool auto_renew{true};
};

/**
 * Parse a certificate document
 * @return nullopt if the document is not a JSON object or a field has the wrong type
 */
std::optional<CertificateRecord> parse_certificate_record(std::string_view document);

/**
 * Read the PEM material a record refers to and convert it to DER
 * @throws CertificateError if a file is unreadable or the PEM is invalid
 */
CertificateMaterial load_material(const CertificateRecord& record);

/**
 * Completion of a record lookup; record is nullopt if neither lookup yields
 * a parseable record
 */
using RecordHandler = std::function<void(std::exception_ptr error, std::optional<CertificateRecord> record)>;

/**
 * Completion of a certificate selection; material is nullopt when nothing
 * can be installed
 */
using MaterialHandler = std::function<void(std::optional<CertificateMaterial> material)>;

/**
 * Certificate Selector
 *
 * Runs once per TLS handshake with the raw SNI value. Lookup order is the
 * normalized server name, then the raw server name; both keys are read in
 * one round-trip.
 */
class CertificateSelector {
public:
    explicit CertificateSelector(store::StorePool& pool,
                                 std::span<const routing::NormalizationRule> rules = routing::default_rules());

    // Non-copyable
    CertificateSelector(const CertificateSelector&) = delete;
    CertificateSelector& operator=(const CertificateSelector&) = delete;

    /**
     * Find the certificate record for a server name
     * The handler receives a store::StoreError when the store is unavailable.
     */
    void async_find_record(store::StoreClient& store, std::string server_name, RecordHandler handler) const;

    /**
     * Handshake entry point: look up and load the material for a server name
     *
     * Leases a store connection for the lookup. The handler always runs;
     * store and certificate failures are logged and yield nullopt, leaving
     * the connection with the context's default (if any).
     */
    void async_select(std::string server_name, MaterialHandler handler) const;

    /**
     * Install loaded material on one connection
     * Never throws; failures are logged.
     * @return true if the certificate was installed
     */
    static bool install(SSL* ssl, const CertificateMaterial& material, std::string_view server_name);

private:
    store::StorePool& pool_;
    std::span<const routing::NormalizationRule> rules_;
};

} // namespace waypoint::certs

#endif // WAYPOINT_CERTS_CERTIFICATE_SELECTOR_HPP
