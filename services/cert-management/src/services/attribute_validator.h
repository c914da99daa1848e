#pragma once

#include "../domain/models/create_request.h"
#include "../repositories/certificate_repository.h"
#include "exceptions.h"

#include <string>

/**
 * @file attribute_validator.h
 * @brief Pre-validation shared by certificate and CA workflows
 *
 * Both checks append to a ValidationErrors collector; the caller raises
 * the whole batch.
 */

namespace services {

class AttributeValidator {
public:
    /// @throws std::invalid_argument if either repository is nullptr
    AttributeValidator(repositories::ICertificateRepository* certificates,
                       repositories::ICertificateRepository* authorities);

    /**
     * @brief Record name checks
     *
     * Unique across certificates and CAs, not a reserved issuer label,
     * and matching [A-Za-z0-9_-]+. Errors are tagged "<schema>.name".
     */
    void validateName(const std::string& schema, const std::string& name,
                      common::ValidationErrors& errors) const;

    /**
     * @brief Checks on the attributes any creation variant may carry
     *
     * Country code, certificate PEM, private key with passphrase, key
     * length, signing CA, CSR, csr_id and the key/certificate match.
     */
    void validateCommonAttributes(const std::string& schema,
                                  const domain::models::CommonAttributes& attrs,
                                  common::ValidationErrors& errors) const;

private:
    repositories::ICertificateRepository* certificates_;
    repositories::ICertificateRepository* authorities_;
};

} // namespace services
