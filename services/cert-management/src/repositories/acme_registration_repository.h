/**
 * @file acme_registration_repository.h
 * @brief Repository Interface - ACME account registrations (acme_registration)
 */

#pragma once

#include "../domain/models/acme_models.h"
#include "i_query_executor.h"

#include <optional>
#include <string>

namespace repositories {

class IAcmeRegistrationRepository {
public:
    virtual ~IAcmeRegistrationRepository() = default;

    virtual std::optional<domain::models::AcmeRegistration> findById(int64_t id) = 0;

    /// Lookup by directory URI (with trailing '/')
    virtual std::optional<domain::models::AcmeRegistration> findByDirectory(
        const std::string& directory) = 0;

    /// @return Generated id
    virtual int64_t insert(const domain::models::AcmeRegistration& registration) = 0;
};

class PgAcmeRegistrationRepository : public IAcmeRegistrationRepository {
public:
    explicit PgAcmeRegistrationRepository(common::IQueryExecutor* queryExecutor);

    std::optional<domain::models::AcmeRegistration> findById(int64_t id) override;
    std::optional<domain::models::AcmeRegistration> findByDirectory(const std::string& directory) override;
    int64_t insert(const domain::models::AcmeRegistration& registration) override;

private:
    std::optional<domain::models::AcmeRegistration> findOne(const std::string& where,
                                                            const std::string& param);

    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
