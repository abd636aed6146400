/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * Certificate Selector implementation
 */

#include "certs/certificate_selector.hpp"
#include "store/keys.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace waypoint::certs {

using util::log_component::TLS;

namespace {

/**
 * Copy j[key] into out when it is a string; other types are rejected
 */
void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<std::string>();
    }
}

std::string read_file(const std::string& path, const char* what) {
    if (path.empty()) {
        throw CertificateError(std::string("No ") + what + " configured");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CertificateError(std::string("Cannot read ") + what + ": " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // anonymous namespace

std::optional<CertificateRecord> parse_certificate_record(std::string_view document) {
    try {
        auto j = nlohmann::json::parse(document);
        if (!j.is_object()) {
            return std::nullopt;
        }

        CertificateRecord record;
        read_string(j, "domain", record.domain);
        read_string(j, "cert_path", record.cert_path);
        read_string(j, "key_path", record.key_path);
        read_string(j, "cert_pem", record.cert_pem);
        read_string(j, "key_pem", record.key_pem);

        // expires_at may be serialized as a string or an epoch number
        if (auto it = j.find("expires_at"); it != j.end() && !it->is_null()) {
            record.expires_at = it->is_string() ? it->get<std::string>() : it->dump();
        }
        if (auto it = j.find("auto_renew"); it != j.end() && !it->is_null()) {
            record.auto_renew = it->get<bool>();
        }
        return record;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

CertificateMaterial load_material(const CertificateRecord& record) {
    std::string cert_pem = record.cert_pem.empty()
        ? read_file(record.cert_path, "certificate file")
        : record.cert_pem;
    std::string key_pem = record.key_pem.empty()
        ? read_file(record.key_path, "private key file")
        : record.key_pem;

    CertificateMaterial material;
    material.chain = pem_chain_to_der(cert_pem);
    material.private_key = pem_key_to_der(key_pem);
    return material;
}

CertificateSelector::CertificateSelector(store::StorePool& pool,
                                         std::span<const routing::NormalizationRule> rules)
    : pool_(pool)
    , rules_(rules) {
}

void CertificateSelector::async_find_record(store::StoreClient& store, std::string server_name,
                                            RecordHandler handler) const {
    std::string normalized = routing::normalize_host(server_name, rules_);

    std::vector<store::Command> lookups;
    lookups.push_back({"GET", store::keys::certificate(normalized)});
    if (normalized != server_name) {
        lookups.push_back({"GET", store::keys::certificate(server_name)});
    }

    store.async_execute(std::move(lookups),
        [server_name = std::move(server_name), handler = std::move(handler)](
            std::exception_ptr error, std::vector<store::resp::Value> replies) mutable {
            std::optional<std::string> document;
            if (!error) {
                try {
                    document = store::resp::as_string(replies[0], "GET");
                    if (!document && replies.size() > 1) {
                        document = store::resp::as_string(replies[1], "GET");
                    }
                } catch (const store::StoreError&) {
                    error = std::current_exception();
                }
            }
            if (error) {
                handler(error, std::nullopt);
                return;
            }
            if (!document) {
                handler(nullptr, std::nullopt);
                return;
            }

            auto record = parse_certificate_record(*document);
            if (!record) {
                WAYPOINT_LOG_WARN(TLS, "Malformed certificate record for {}", server_name);
            }
            handler(nullptr, std::move(record));
        });
}

void CertificateSelector::async_select(std::string server_name, MaterialHandler handler) const {
    if (server_name.empty()) {
        handler(std::nullopt);
        return;
    }

    std::shared_ptr<store::StoreLease> lease;
    try {
        lease = std::make_shared<store::StoreLease>(pool_.acquire());
    } catch (const store::StoreError& e) {
        WAYPOINT_LOG_ERROR(TLS, "Store unavailable during certificate lookup for {}: {}", server_name, e.what());
        handler(std::nullopt);
        return;
    }

    auto& client = lease->client();
    async_find_record(client, server_name,
        [lease, server_name, handler = std::move(handler)](
            std::exception_ptr error, std::optional<CertificateRecord> record) mutable {
            if (error) {
                lease->mark_failed();
            }
            lease->release();

            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    WAYPOINT_LOG_ERROR(TLS, "Store unavailable during certificate lookup for {}: {}",
                                       server_name, e.what());
                }
                handler(std::nullopt);
                return;
            }

            if (!record) {
                WAYPOINT_LOG_DEBUG(TLS, "No certificate record for {}", server_name);
                handler(std::nullopt);
                return;
            }

            std::optional<CertificateMaterial> material;
            try {
                material = load_material(*record);
            } catch (const CertificateError& e) {
                WAYPOINT_LOG_ERROR(TLS, "Failed to load certificate for {}: {}", server_name, e.what());
            }
            handler(std::move(material));
        });
}

bool CertificateSelector::install(SSL* ssl, const CertificateMaterial& material, std::string_view server_name) {
    try {
        install_certificate(ssl, material);
        if (leaf_expired(material)) {
            WAYPOINT_LOG_WARN(TLS, "Certificate for {} has expired", server_name);
        }
        WAYPOINT_LOG_DEBUG(TLS, "Installed certificate for {} ({})", server_name, leaf_subject(material));
        return true;
    } catch (const CertificateError& e) {
        WAYPOINT_LOG_ERROR(TLS, "Failed to install certificate for {}: {}", server_name, e.what());
        return false;
    }
}

} // namespace waypoint::certs
