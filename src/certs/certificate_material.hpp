/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Certificate Material - PEM decoding, DER conversion and per-handshake installation
 */

#ifndef WAYPOINT_CERTS_CERTIFICATE_MATERIAL_HPP
#define WAYPOINT_CERTS_CERTIFICATE_MATERIAL_HPP

#include <openssl/ssl.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::certs {

/**
 * Raised when certificate or key material cannot be read, decoded or installed
 */
class CertificateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using DerBuffer = std::vector<unsigned char>;

/**
 * Certificate chain and private key in DER form, ready for a handshake
 */
struct CertificateMaterial {
    std::vector<DerBuffer> chain;   // Leaf first, then intermediates
    DerBuffer private_key;
};

/**
 * Convert a PEM certificate chain to DER
 * @throws CertificateError if no certificate can be decoded
 */
std::vector<DerBuffer> pem_chain_to_der(std::string_view pem);

/**
 * Convert a PEM private key (any algorithm) to DER
 * @throws CertificateError if the key cannot be decoded
 */
DerBuffer pem_key_to_der(std::string_view pem);

/**
 * Install chain and key on a single connection, replacing whatever the
 * context would have presented
 * @throws CertificateError on decode failure or key mismatch
 */
void install_certificate(SSL* ssl, const CertificateMaterial& material);

/**
 * Subject of the leaf certificate, for logging
 */
std::string leaf_subject(const CertificateMaterial& material);

/**
 * Whether the leaf certificate's notAfter lies in the past
 */
bool leaf_expired(const CertificateMaterial& material);

/**
 * Description of the most recent OpenSSL error, clearing the error queue
 */
std::string openssl_error_string();

} // namespace waypoint::certs

#endif // WAYPOINT_CERTS_CERTIFICATE_MATERIAL_HPP
