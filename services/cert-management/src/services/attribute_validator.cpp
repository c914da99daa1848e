/**
 * @file attribute_validator.cpp
 * @brief AttributeValidator implementation
 */

#include "attribute_validator.h"
#include "../domain/models/certificate_view.h"

#include <certmgr/pki/cert_ops.h>
#include <certmgr/pki/country_codes.h>
#include <certmgr/pki/pem.h>

#include <regex>
#include <stdexcept>

namespace services {

namespace pki = certmgr::pki;

namespace {

bool present(const std::optional<std::string>& value) {
    return value && !value->empty();
}

} // anonymous namespace

AttributeValidator::AttributeValidator(repositories::ICertificateRepository* certificates,
                                       repositories::ICertificateRepository* authorities)
    : certificates_(certificates), authorities_(authorities)
{
    if (!certificates_ || !authorities_) {
        throw std::invalid_argument("AttributeValidator: repositories cannot be nullptr");
    }
}

void AttributeValidator::validateName(const std::string& schema, const std::string& name,
                                      common::ValidationErrors& errors) const {
    const std::string field = schema + ".name";

    if (certificates_->findByName(name) || authorities_->findByName(name)) {
        errors.add(field, "A certificate with this name already exists");
    }

    if (name == domain::models::kIssuerExternal || name == domain::models::kIssuerSelfSigned ||
        name == domain::models::kIssuerPendingSignature) {
        errors.add(field, name + " is a reserved internal keyword for Certificate Management");
    }

    static const std::regex pattern("^[A-Za-z0-9_-]+$");
    if (!std::regex_match(name, pattern)) {
        errors.add(field, "Use alphanumeric characters, \"_\" and \"-\".");
    }
}

void AttributeValidator::validateCommonAttributes(const std::string& schema,
                                                  const domain::models::CommonAttributes& attrs,
                                                  common::ValidationErrors& errors) const {
    const std::string certificateField = schema + ".certificate";
    const std::string privatekeyField = schema + ".privatekey";
    const std::string passphrase = attrs.passphrase.value_or("");

    if (present(attrs.country) && !pki::isValidCountryCode(*attrs.country)) {
        errors.add(schema + ".country", "Please provide a valid ISO 3166-1 alpha-2 country code");
    }

    if (present(attrs.certificate)) {
        if (pki::splitPemBlocks(*attrs.certificate).empty()) {
            errors.add(certificateField, "Not a valid certificate");
        } else if (!pki::loadCertificate(*attrs.certificate)) {
            errors.add(certificateField, "Certificate not in PEM format");
        }
    }

    if (present(attrs.privatekey) && !pki::loadPrivateKey(*attrs.privatekey, passphrase).ok()) {
        errors.add(privatekeyField,
                   "Please provide a valid private key with matching passphrase ( if any )");
    }

    if (attrs.keyLength && *attrs.keyLength != 0 &&
        *attrs.keyLength != 1024 && *attrs.keyLength != 2048 && *attrs.keyLength != 4096) {
        errors.add(schema + ".key_length", "Key length must be a valid value ( 1024, 2048, 4096 )");
    }

    if (attrs.signedby && *attrs.signedby != 0) {
        auto ca = authorities_->findById(*attrs.signedby);
        if (!ca || !ca->hasCertificate() || !ca->hasPrivateKey()) {
            errors.add(schema + ".signedby", "Please provide a valid signing authority");
        }
    }

    if (present(attrs.csr) && !pki::loadCertificateRequest(*attrs.csr)) {
        errors.add(schema + ".CSR", "Please provide a valid CSR");
    }

    if (attrs.csrId && *attrs.csrId != 0) {
        auto csrRecord = certificates_->findById(*attrs.csrId);
        if (!csrRecord || !csrRecord->hasCsr()) {
            errors.add(schema + ".csr_id", "Please provide a valid csr_id which has a valid CSR filed");
        }
    }

    // Only meaningful once both halves decoded cleanly
    if (present(attrs.certificate) && present(attrs.privatekey) &&
        !errors.contains(certificateField) && !errors.contains(privatekeyField)) {
        pki::UniqueCert cert = pki::loadCertificate(*attrs.certificate);
        pki::KeyLoadResult key = pki::loadPrivateKey(*attrs.privatekey, passphrase);
        if (cert && key.ok() && !pki::keyMatchesCertificate(cert.get(), key.key.get())) {
            errors.add(privatekeyField, "Private key does not match certificate: key values mismatch");
        }
    }
}

} // namespace services
