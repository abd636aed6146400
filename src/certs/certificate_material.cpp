/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Certificate Material implementation
 */

#include "certs/certificate_material.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <climits>
#include <memory>

namespace waypoint::certs {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};

struct X509Deleter {
    void operator()(X509* cert) const noexcept { X509_free(cert); }
};

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

BioPtr memory_bio(std::string_view pem) {
    if (pem.size() > static_cast<std::size_t>(INT_MAX)) {
        throw CertificateError("PEM payload too large");
    }
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CertificateError("Failed to allocate BIO: " + openssl_error_string());
    }
    return bio;
}

DerBuffer certificate_to_der(X509* cert) {
    int length = i2d_X509(cert, nullptr);
    if (length <= 0) {
        throw CertificateError("Failed to encode certificate: " + openssl_error_string());
    }
    DerBuffer der(static_cast<std::size_t>(length));
    unsigned char* out = der.data();
    i2d_X509(cert, &out);
    return der;
}

X509Ptr der_to_certificate(const DerBuffer& der) {
    const unsigned char* in = der.data();
    X509Ptr cert(d2i_X509(nullptr, &in, static_cast<long>(der.size())));
    if (!cert) {
        throw CertificateError("Failed to decode DER certificate: " + openssl_error_string());
    }
    return cert;
}

} // anonymous namespace

std::string openssl_error_string() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

std::vector<DerBuffer> pem_chain_to_der(std::string_view pem) {
    auto bio = memory_bio(pem);

    std::vector<DerBuffer> chain;
    while (true) {
        X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) {
            break;
        }
        chain.push_back(certificate_to_der(cert.get()));
    }

    if (chain.empty()) {
        throw CertificateError("No certificate found in PEM data: " + openssl_error_string());
    }

    // Reading past the last certificate leaves "no start line" on the queue
    ERR_clear_error();
    return chain;
}

DerBuffer pem_key_to_der(std::string_view pem) {
    auto bio = memory_bio(pem);

    PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw CertificateError("Failed to decode private key: " + openssl_error_string());
    }

    int length = i2d_PrivateKey(key.get(), nullptr);
    if (length <= 0) {
        throw CertificateError("Failed to encode private key: " + openssl_error_string());
    }
    DerBuffer der(static_cast<std::size_t>(length));
    unsigned char* out = der.data();
    i2d_PrivateKey(key.get(), &out);
    return der;
}

void install_certificate(SSL* ssl, const CertificateMaterial& material) {
    if (material.chain.empty()) {
        throw CertificateError("Certificate chain is empty");
    }

    auto leaf = der_to_certificate(material.chain.front());
    if (SSL_use_certificate(ssl, leaf.get()) != 1) {
        throw CertificateError("Failed to set certificate: " + openssl_error_string());
    }

    if (SSL_clear_chain_certs(ssl) != 1) {
        throw CertificateError("Failed to clear certificate chain: " + openssl_error_string());
    }
    for (std::size_t i = 1; i < material.chain.size(); ++i) {
        auto intermediate = der_to_certificate(material.chain[i]);
        if (SSL_add1_chain_cert(ssl, intermediate.get()) != 1) {
            throw CertificateError("Failed to add chain certificate: " + openssl_error_string());
        }
    }

    const unsigned char* in = material.private_key.data();
    PkeyPtr key(d2i_AutoPrivateKey(nullptr, &in, static_cast<long>(material.private_key.size())));
    if (!key) {
        throw CertificateError("Failed to decode DER private key: " + openssl_error_string());
    }
    if (SSL_use_PrivateKey(ssl, key.get()) != 1) {
        throw CertificateError("Failed to set private key: " + openssl_error_string());
    }

    if (SSL_check_private_key(ssl) != 1) {
        throw CertificateError("Private key does not match certificate: " + openssl_error_string());
    }
}

std::string leaf_subject(const CertificateMaterial& material) {
    if (material.chain.empty()) {
        return "(no certificate)";
    }
    auto leaf = der_to_certificate(material.chain.front());

    char buf[256];
    X509_NAME_oneline(X509_get_subject_name(leaf.get()), buf, sizeof(buf));
    return std::string(buf);
}

bool leaf_expired(const CertificateMaterial& material) {
    if (material.chain.empty()) {
        return false;
    }
    auto leaf = der_to_certificate(material.chain.front());
    const ASN1_TIME* not_after = X509_get0_notAfter(leaf.get());
    return not_after != nullptr && X509_cmp_current_time(not_after) < 0;
}

} // namespace waypoint::certs
