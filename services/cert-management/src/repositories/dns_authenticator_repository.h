/**
 * @file dns_authenticator_repository.h
 * @brief Repository Interface - configured DNS authenticators (acme_dns_authenticator)
 */

#pragma once

#include "../domain/models/acme_models.h"
#include "i_query_executor.h"

#include <optional>
#include <vector>

namespace repositories {

class IDnsAuthenticatorRepository {
public:
    virtual ~IDnsAuthenticatorRepository() = default;

    virtual std::optional<domain::models::DnsAuthenticator> findById(int64_t id) = 0;

    virtual std::vector<domain::models::DnsAuthenticator> findAll() = 0;
};

class PgDnsAuthenticatorRepository : public IDnsAuthenticatorRepository {
public:
    explicit PgDnsAuthenticatorRepository(common::IQueryExecutor* queryExecutor);

    std::optional<domain::models::DnsAuthenticator> findById(int64_t id) override;
    std::vector<domain::models::DnsAuthenticator> findAll() override;

private:
    std::vector<domain::models::DnsAuthenticator> select(const std::string& where,
                                                         const std::vector<std::string>& params);

    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
