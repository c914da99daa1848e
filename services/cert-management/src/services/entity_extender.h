#pragma once

#include "../domain/models/certificate_view.h"
#include "../repositories/certificate_repository.h"
#include "certificate_paths.h"

#include <set>

/**
 * @file entity_extender.h
 * @brief Record -> API view resolution
 *
 * Resolves the issuer chain, validity window, subject DN and file paths of
 * a stored record. Reads CA rows through the repository and never writes.
 *
 * @date 2026-02-18
 */

namespace services {

class EntityExtender {
public:
    /**
     * @param authorities CA store used to resolve signedby (non-owning)
     * @throws std::invalid_argument if authorities is nullptr
     */
    EntityExtender(repositories::ICertificateRepository* authorities, CertificatePaths paths);

    domain::models::CertificateView extend(const domain::models::CertificateRecord& record,
                                           domain::models::Store store) const;

    std::vector<domain::models::CertificateView> extendAll(
        const std::vector<domain::models::CertificateRecord>& records,
        domain::models::Store store) const;

    const CertificatePaths& paths() const { return paths_; }

private:
    domain::models::CertificateView extendGuarded(const domain::models::CertificateRecord& record,
                                                  domain::models::Store store,
                                                  std::set<int64_t>& visitedCas) const;

    std::optional<domain::models::Issuer> resolveIssuer(const domain::models::CertificateRecord& record,
                                                        std::set<int64_t>& visitedCas) const;

    repositories::ICertificateRepository* authorities_;
    CertificatePaths paths_;
};

} // namespace services
