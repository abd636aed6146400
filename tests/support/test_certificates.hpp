/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Self-signed certificate generation for TLS tests
 */

#ifndef WAYPOINT_TESTS_SUPPORT_TEST_CERTIFICATES_HPP
#define WAYPOINT_TESTS_SUPPORT_TEST_CERTIFICATES_HPP

#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace waypoint::test {

struct PemPair {
    std::string cert_pem;
    std::string key_pem;
};

namespace detail {

inline std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<std::size_t>(length));
}

} // namespace detail

/**
 * Generate an EC P-256 key and a self-signed certificate for common_name
 * @param valid_from_days Offset of notBefore from now, in days
 * @param valid_until_days Offset of notAfter from now, in days
 */
inline PemPair make_self_signed(const std::string& common_name,
                                long valid_from_days = -1,
                                long valid_until_days = 30) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), EVP_PKEY_free);
    if (!key) {
        throw std::runtime_error("key generation failed");
    }

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), X509_free);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), valid_from_days * 24 * 3600);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), valid_until_days * 24 * 3600);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("certificate signing failed");
    }

    std::unique_ptr<BIO, decltype(&BIO_free)> cert_bio(BIO_new(BIO_s_mem()), BIO_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> key_bio(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_X509(cert_bio.get(), cert.get());
    PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr);

    return PemPair{
        .cert_pem = detail::bio_to_string(cert_bio.get()),
        .key_pem = detail::bio_to_string(key_bio.get())
    };
}

} // namespace waypoint::test

#endif // WAYPOINT_TESTS_SUPPORT_TEST_CERTIFICATES_HPP
