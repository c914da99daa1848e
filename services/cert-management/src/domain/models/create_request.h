/**
 * @file create_request.h
 * @brief Domain Models - certificate and CA creation requests
 *
 * Each create_type maps to one alternative of a closed std::variant.
 * Workflows dispatch on the variant with an exhaustive std::visit.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

/// Subject attributes supplied by the caller
struct SubjectRequest {
    std::optional<std::string> country;
    std::optional<std::string> state;
    std::optional<std::string> city;
    std::optional<std::string> organization;
    std::optional<std::string> organizationalUnit;
    std::optional<std::string> common;
    std::optional<std::string> email;
    std::vector<std::string> san;
};

// ---------------------------------------------------------------------------
// Certificate variants
// ---------------------------------------------------------------------------

/// CERTIFICATE_CREATE_INTERNAL
struct CreateInternalCertificate {
    std::string name;
    SubjectRequest subject;
    int keyLength = 0;
    std::string digestAlgorithm;
    int lifetime = 0;
    int64_t signedby = 0;
};

/// CERTIFICATE_CREATE_IMPORTED
struct ImportCertificate {
    std::string name;
    std::string certificate;
    std::optional<std::string> privatekey;
    std::optional<std::string> passphrase;
    std::optional<int64_t> csrId;
};

/// CERTIFICATE_CREATE_CSR
struct CreateCsr {
    std::string name;
    SubjectRequest subject;
    int keyLength = 0;
    std::string digestAlgorithm;
};

/// CERTIFICATE_CREATE_IMPORTED_CSR
struct ImportCsr {
    std::string name;
    std::string csr;
    std::string privatekey;
    std::optional<std::string> passphrase;
};

/// CERTIFICATE_CREATE_ACME
struct CreateAcmeCertificate {
    std::string name;
    int64_t csrId = 0;
    std::string acmeDirectoryUri;
    std::map<std::string, int64_t> dnsMapping;
    bool tos = false;
    int renewDays = 10;
};

/// CERTIFICATE_CREATE: internal passthrough used by CA signing
struct CreateFromSignedCertificate {
    std::string name;
    std::string certificate;
    std::optional<std::string> privatekey;  ///< Unset when the CSR carried no key
    int type = 0;
    std::optional<int64_t> signedby;
};

using CertificateCreateRequest = std::variant<
    CreateInternalCertificate,
    ImportCertificate,
    CreateCsr,
    ImportCsr,
    CreateAcmeCertificate,
    CreateFromSignedCertificate>;

// ---------------------------------------------------------------------------
// Certificate authority variants
// ---------------------------------------------------------------------------

/// CA_CREATE_INTERNAL
struct CreateInternalCa {
    std::string name;
    SubjectRequest subject;
    int keyLength = 0;
    std::string digestAlgorithm;
    int lifetime = 0;
};

/// CA_CREATE_IMPORTED
struct ImportCa {
    std::string name;
    std::string certificate;
    std::optional<std::string> privatekey;
    std::optional<std::string> passphrase;
};

/// CA_CREATE_INTERMEDIATE
struct CreateIntermediateCa {
    std::string name;
    SubjectRequest subject;
    int keyLength = 0;
    std::string digestAlgorithm;
    int lifetime = 0;
    int64_t signedby = 0;
};

using CaCreateRequest = std::variant<CreateInternalCa, ImportCa, CreateIntermediateCa>;

struct CaSignCsrRequest {
    int64_t caId = 0;
    int64_t csrCertId = 0;
    std::string name;
};

/// CA update: rename, or CA_SIGN_CSR routed to ca_sign_csr
struct CaUpdateRequest {
    std::optional<std::string> name;
    std::optional<std::string> createType;
    std::optional<int64_t> csrCertId;
};

// ---------------------------------------------------------------------------
// Shared attribute view for pre-validation
// ---------------------------------------------------------------------------

/**
 * @brief The attributes common validation looks at, whichever variant carries them
 */
struct CommonAttributes {
    std::optional<std::string> country;
    std::optional<std::string> certificate;
    std::optional<std::string> privatekey;
    std::optional<std::string> passphrase;
    std::optional<int> keyLength;
    std::optional<std::string> digestAlgorithm;
    std::optional<int64_t> signedby;
    std::optional<std::string> csr;
    std::optional<int64_t> csrId;
};

CommonAttributes commonAttributes(const CertificateCreateRequest& request);
CommonAttributes commonAttributes(const CaCreateRequest& request);

const std::string& requestName(const CertificateCreateRequest& request);
const std::string& requestName(const CaCreateRequest& request);

// ---------------------------------------------------------------------------
// JSON parsing (command-line front end)
// ---------------------------------------------------------------------------

/**
 * @brief Build a certificate request from its JSON form, selected by "create_type"
 * @throws common::ValidationException for an unknown create_type or missing required fields
 */
CertificateCreateRequest parseCertificateCreateRequest(const Json::Value& json);

CaCreateRequest parseCaCreateRequest(const Json::Value& json);

CaSignCsrRequest parseCaSignCsrRequest(const Json::Value& json);

CaUpdateRequest parseCaUpdateRequest(const Json::Value& json);

} // namespace models
} // namespace domain
