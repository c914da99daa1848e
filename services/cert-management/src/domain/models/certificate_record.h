/**
 * @file certificate_record.h
 * @brief Domain Model - persisted Certificate / Certificate Authority row
 *
 * Certificates and CAs share one record shape and live in two tables
 * (system_certificate, system_certificateauthority). The @c type bit
 * tells them apart.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace domain {
namespace models {

/// Record type bits as stored in the cert_type column
namespace cert_type {
constexpr int CA_EXISTING = 0x01;
constexpr int CA_INTERNAL = 0x02;
constexpr int CA_INTERMEDIATE = 0x04;
constexpr int CERT_EXISTING = 0x08;
constexpr int CERT_INTERNAL = 0x10;
constexpr int CERT_CSR = 0x20;

inline bool isAuthority(int type) {
    return type == CA_EXISTING || type == CA_INTERNAL || type == CA_INTERMEDIATE;
}

inline bool isExisting(int type) {
    return type == CA_EXISTING || type == CERT_EXISTING;
}
} // namespace cert_type

/// Which of the two stores a record belongs to
enum class Store {
    Certificate,
    CertificateAuthority
};

/**
 * @brief Persisted certificate or CA
 *
 * PEM blobs, subject fields and ACME metadata are optional because each
 * creation variant fills a different subset.
 */
struct CertificateRecord {
    int64_t id = 0;
    std::string name;
    int type = 0;

    std::optional<std::string> certificate;
    std::optional<std::string> privatekey;
    std::optional<std::string> csr;

    std::optional<int64_t> serial;          ///< Null only for legacy rows
    std::optional<int64_t> signedby;        ///< CA id, lookup only

    std::optional<std::string> country;
    std::optional<std::string> state;
    std::optional<std::string> city;
    std::optional<std::string> organization;
    std::optional<std::string> organizationalUnit;
    std::optional<std::string> common;
    std::optional<std::string> email;
    std::string san;                        ///< Whitespace-separated

    std::optional<int> keyLength;
    std::optional<std::string> digestAlgorithm;
    std::optional<int> lifetime;

    bool chain = false;

    // ACME metadata (present only on ACME-issued certificates)
    std::optional<int64_t> acme;            ///< acme_registration id
    std::optional<std::string> acmeUri;
    std::map<std::string, int64_t> domainsAuthenticators;
    std::optional<int> renewDays;

    bool isAcme() const { return acme.has_value(); }
    bool isAuthority() const { return cert_type::isAuthority(type); }

    bool hasCertificate() const { return certificate && !certificate->empty(); }
    bool hasPrivateKey() const { return privatekey && !privatekey->empty(); }
    bool hasCsr() const { return csr && !csr->empty(); }
};

} // namespace models
} // namespace domain
