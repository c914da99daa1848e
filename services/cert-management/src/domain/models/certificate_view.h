/**
 * @file certificate_view.h
 * @brief Domain Model - derived, API-facing view of a record
 *
 * Built by EntityExtender on every read and never persisted.
 */

#pragma once

#include "certificate_record.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>

namespace domain {
namespace models {

struct CertificateView;

struct ExternalIssuer {};
struct SelfSignedIssuer {};
struct PendingSignatureIssuer {};

/// Issued by a CA known to this system
struct SignedByIssuer {
    std::shared_ptr<const CertificateView> parent;
};

using Issuer = std::variant<ExternalIssuer, SelfSignedIssuer, PendingSignatureIssuer, SignedByIssuer>;

/// Reserved labels; also rejected as record names
constexpr const char* kIssuerExternal = "external";
constexpr const char* kIssuerSelfSigned = "self-signed";
constexpr const char* kIssuerPendingSignature = "external - signature pending";

struct CertificateView {
    /// Stored fields with privatekey and CSR re-encoded when they decode
    CertificateRecord record;
    Store store = Store::Certificate;

    /// nullopt when an internal record's parent CA cannot be resolved
    std::optional<Issuer> issuer;

    std::string rootPath;
    std::string certificatePath;
    std::string privatekeyPath;
    std::string csrPath;

    std::vector<std::string> chainList;     ///< Leaf first

    std::optional<std::string> from;
    std::optional<std::string> until;
    std::optional<std::string> dn;

    bool internal = false;
    std::vector<std::string> san;

    /// CA view of the SignedBy issuer, or nullptr
    const CertificateView* signingAuthority() const;

    /**
     * @brief Serialize for the command-line front end
     *
     * Issuer renders as its label, or as the nested parent view for
     * SignedBy. ACME keys appear only on ACME-issued records.
     */
    Json::Value toJson() const;
};

} // namespace models
} // namespace domain
