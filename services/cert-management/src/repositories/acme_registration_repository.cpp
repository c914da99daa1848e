#include "acme_registration_repository.h"
#include "query_helpers.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

using domain::models::AcmeRegistration;

PgAcmeRegistrationRepository::PgAcmeRegistrationRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("PgAcmeRegistrationRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<AcmeRegistration> PgAcmeRegistrationRepository::findById(int64_t id) {
    return findOne("id = $1", std::to_string(id));
}

std::optional<AcmeRegistration> PgAcmeRegistrationRepository::findByDirectory(const std::string& directory) {
    return findOne("directory = $1", directory);
}

std::optional<AcmeRegistration> PgAcmeRegistrationRepository::findOne(
    const std::string& where, const std::string& param)
{
    using namespace common::db;

    Json::Value rows;
    try {
        rows = queryExecutor_->executeQuery(
            "SELECT id, uri, directory, tos, new_account_uri, new_nonce_uri, new_order_uri, "
            "revoke_cert_uri, status, contact, private_key FROM acme_registration WHERE " + where +
            " ORDER BY id LIMIT 1",
            {param});
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(std::string("acme_registration query failed: ") + e.what());
    }

    if (rows.empty()) return std::nullopt;
    const Json::Value& row = rows[0];

    AcmeRegistration r;
    r.id = getInt64(row, "id");
    r.uri = getString(row, "uri");
    r.directory = getString(row, "directory");
    r.tos = getString(row, "tos");
    r.newAccountUri = getString(row, "new_account_uri");
    r.newNonceUri = getString(row, "new_nonce_uri");
    r.newOrderUri = getString(row, "new_order_uri");
    r.revokeCertUri = getString(row, "revoke_cert_uri");
    r.status = getString(row, "status");
    r.contact = getString(row, "contact");
    r.privateKeyPem = getString(row, "private_key");
    return r;
}

int64_t PgAcmeRegistrationRepository::insert(const AcmeRegistration& r) {
    try {
        Json::Value rows = queryExecutor_->executeQuery(
            "INSERT INTO acme_registration (uri, directory, tos, new_account_uri, new_nonce_uri, "
            "new_order_uri, revoke_cert_uri, status, contact, private_key) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) RETURNING id",
            {r.uri, r.directory, r.tos, r.newAccountUri, r.newNonceUri, r.newOrderUri,
             r.revokeCertUri, r.status, r.contact, r.privateKeyPem});
        if (rows.empty()) {
            throw common::DatabaseException("acme_registration insert returned no id");
        }
        int64_t id = common::db::getInt64(rows[0], "id");
        spdlog::info("[AcmeRegistrationRepository] Registered account {} for {}", id, r.directory);
        return id;
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(std::string("acme_registration insert failed: ") + e.what());
    }
}

} // namespace repositories
