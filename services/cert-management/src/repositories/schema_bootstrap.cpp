#include "schema_bootstrap.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

namespace {

std::string certificateTable(const std::string& table, const std::string& signedByTarget) {
    return "CREATE TABLE IF NOT EXISTS " + table + " ("
        "id BIGSERIAL PRIMARY KEY, "
        "cert_name VARCHAR(120) NOT NULL UNIQUE, "
        "cert_type INTEGER NOT NULL, "
        "cert_certificate TEXT, "
        "cert_privatekey TEXT, "
        "cert_csr TEXT, "
        "cert_serial BIGINT, "
        "cert_signedby BIGINT REFERENCES " + signedByTarget + "(id) ON DELETE SET NULL, "
        "cert_country VARCHAR(120), "
        "cert_state VARCHAR(120), "
        "cert_city VARCHAR(120), "
        "cert_organization VARCHAR(120), "
        "cert_organizational_unit VARCHAR(120), "
        "cert_common TEXT, "
        "cert_email VARCHAR(255), "
        "cert_san TEXT, "
        "cert_key_length INTEGER, "
        "cert_digest_algorithm VARCHAR(120), "
        "cert_lifetime INTEGER, "
        "cert_chain BOOLEAN NOT NULL DEFAULT FALSE, "
        "cert_acme_id BIGINT REFERENCES acme_registration(id) ON DELETE SET NULL, "
        "cert_acme_uri TEXT, "
        "cert_domains_authenticators TEXT, "
        "cert_renew_days INTEGER"
        ")";
}

} // anonymous namespace

SchemaBootstrap::SchemaBootstrap(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("SchemaBootstrap: queryExecutor cannot be nullptr");
    }
}

const std::vector<std::string>& SchemaBootstrap::statements() {
    static const std::vector<std::string> ddl = {
        "CREATE TABLE IF NOT EXISTS acme_registration ("
            "id BIGSERIAL PRIMARY KEY, "
            "uri TEXT NOT NULL, "
            "directory TEXT NOT NULL UNIQUE, "
            "tos TEXT, "
            "new_account_uri TEXT NOT NULL, "
            "new_nonce_uri TEXT NOT NULL, "
            "new_order_uri TEXT NOT NULL, "
            "revoke_cert_uri TEXT NOT NULL, "
            "status VARCHAR(32), "
            "contact TEXT, "
            "private_key TEXT NOT NULL"
            ")",
        "CREATE TABLE IF NOT EXISTS acme_dns_authenticator ("
            "id BIGSERIAL PRIMARY KEY, "
            "name VARCHAR(64) NOT NULL UNIQUE, "
            "authenticator VARCHAR(64) NOT NULL, "
            "attributes TEXT"
            ")",
        certificateTable("system_certificateauthority", "system_certificateauthority"),
        certificateTable("system_certificate", "system_certificateauthority"),
        "CREATE TABLE IF NOT EXISTS system_settings ("
            "id INTEGER PRIMARY KEY, "
            "ui_certificate_id BIGINT REFERENCES system_certificate(id) ON DELETE SET NULL"
            ")",
        // Serials are unique per issuing CA; rows without an issuer or serial are exempt
        "CREATE UNIQUE INDEX IF NOT EXISTS system_certificateauthority_signedby_serial_idx "
            "ON system_certificateauthority (cert_signedby, cert_serial) "
            "WHERE cert_signedby IS NOT NULL AND cert_serial IS NOT NULL",
        "CREATE UNIQUE INDEX IF NOT EXISTS system_certificate_signedby_serial_idx "
            "ON system_certificate (cert_signedby, cert_serial) "
            "WHERE cert_signedby IS NOT NULL AND cert_serial IS NOT NULL",
    };
    return ddl;
}

void SchemaBootstrap::ensureSchema() {
    for (const auto& statement : statements()) {
        try {
            queryExecutor_->executeCommand(statement, {});
        } catch (const common::DatabaseException&) {
            throw;
        } catch (const std::exception& e) {
            throw common::DatabaseException(std::string("schema bootstrap failed: ") + e.what());
        }
    }
    spdlog::info("[SchemaBootstrap] Schema verified ({} statements)", statements().size());
}

} // namespace repositories
