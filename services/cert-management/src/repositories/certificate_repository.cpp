/** @file certificate_repository.cpp
 *  @brief PgCertificateRepository implementation
 */

#include "certificate_repository.h"
#include "query_helpers.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace repositories {

using domain::models::CertificateRecord;
using domain::models::Store;

namespace {

const char* const kColumns =
    "cert_name, cert_type, cert_certificate, cert_privatekey, cert_csr, "
    "cert_serial, cert_signedby, cert_country, cert_state, cert_city, "
    "cert_organization, cert_organizational_unit, cert_common, cert_email, cert_san, "
    "cert_key_length, cert_digest_algorithm, cert_lifetime, cert_chain, "
    "cert_acme_id, cert_acme_uri, cert_domains_authenticators, cert_renew_days";

std::optional<int> optionalInt(const Json::Value& row, const std::string& field) {
    auto value = common::db::getOptionalInt64(row, field);
    if (!value) return std::nullopt;
    return static_cast<int>(*value);
}

std::string intParam(const std::optional<int>& value) {
    return value ? std::to_string(*value) : std::string();
}

std::map<std::string, int64_t> parseMapping(const std::string& text) {
    std::map<std::string, int64_t> mapping;
    if (text.empty()) return mapping;

    Json::CharReaderBuilder builder;
    Json::Value json;
    std::string errs;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &json, &errs) || !json.isObject()) {
        spdlog::warn("[CertificateRepository] Ignoring malformed domains_authenticators: {}", errs);
        return mapping;
    }
    for (const auto& domain : json.getMemberNames()) {
        if (json[domain].isIntegral()) {
            mapping[domain] = json[domain].asInt64();
        }
    }
    return mapping;
}

std::string mappingToText(const std::map<std::string, int64_t>& mapping) {
    Json::Value json(Json::objectValue);
    for (const auto& [domain, authId] : mapping) {
        json[domain] = static_cast<Json::Int64>(authId);
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, json);
}

} // anonymous namespace

PgCertificateRepository::PgCertificateRepository(common::IQueryExecutor* queryExecutor, Store store)
    : queryExecutor_(queryExecutor),
      table_(store == Store::Certificate ? "system_certificate" : "system_certificateauthority")
{
    if (!queryExecutor_) {
        throw std::invalid_argument("PgCertificateRepository: queryExecutor cannot be nullptr");
    }
    spdlog::debug("[CertificateRepository] Initialized (table: {}, DB type: {})",
                  table_, queryExecutor_->getDatabaseType());
}

// --- Queries ---

std::optional<CertificateRecord> PgCertificateRepository::findById(int64_t id) {
    auto rows = selectWhere("id = $1", {std::to_string(id)});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<CertificateRecord> PgCertificateRepository::findByName(const std::string& name) {
    auto rows = selectWhere("cert_name = $1", {name});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<CertificateRecord> PgCertificateRepository::findAll() {
    return selectWhere("", {});
}

std::vector<CertificateRecord> PgCertificateRepository::findBySignedBy(int64_t caId) {
    return selectWhere("cert_signedby = $1", {std::to_string(caId)});
}

std::vector<CertificateRecord> PgCertificateRepository::findAcmeIssued() {
    return selectWhere("cert_acme_id IS NOT NULL", {});
}

std::vector<CertificateRecord> PgCertificateRepository::selectWhere(
    const std::string& where, const std::vector<std::string>& params)
{
    std::string query = std::string("SELECT id, ") + kColumns + " FROM " + table_;
    if (!where.empty()) query += " WHERE " + where;
    query += " ORDER BY id";

    try {
        Json::Value rows = queryExecutor_->executeQuery(query, params);
        std::vector<CertificateRecord> records;
        records.reserve(rows.size());
        for (const auto& row : rows) {
            records.push_back(rowToRecord(row));
        }
        return records;
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(table_ + " query failed: " + e.what());
    }
}

// --- Commands ---

int64_t PgCertificateRepository::insert(const CertificateRecord& record) {
    std::string query = "INSERT INTO " + table_ + " (" + kColumns + ") VALUES ("
        "$1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, "
        "$16, $17, $18, $19, $20, $21, $22, $23) RETURNING id";

    try {
        Json::Value rows = queryExecutor_->executeQuery(query, recordParams(record));
        if (rows.empty()) {
            throw common::DatabaseException(table_ + " insert returned no id");
        }
        int64_t id = common::db::getInt64(rows[0], "id");
        spdlog::debug("[CertificateRepository] Inserted {} id={} name={}", table_, id, record.name);
        return id;
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(table_ + " insert failed: " + e.what());
    }
}

void PgCertificateRepository::update(const CertificateRecord& record) {
    std::string query = "UPDATE " + table_ + " SET "
        "cert_name = $1, cert_type = $2, cert_certificate = $3, cert_privatekey = $4, "
        "cert_csr = $5, cert_serial = $6, cert_signedby = $7, cert_country = $8, "
        "cert_state = $9, cert_city = $10, cert_organization = $11, "
        "cert_organizational_unit = $12, cert_common = $13, cert_email = $14, cert_san = $15, "
        "cert_key_length = $16, cert_digest_algorithm = $17, cert_lifetime = $18, "
        "cert_chain = $19, cert_acme_id = $20, cert_acme_uri = $21, "
        "cert_domains_authenticators = $22, cert_renew_days = $23 "
        "WHERE id = $24";

    std::vector<std::string> params = recordParams(record);
    params.push_back(std::to_string(record.id));

    try {
        queryExecutor_->executeCommand(query, params);
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(table_ + " update failed: " + e.what());
    }
}

bool PgCertificateRepository::remove(int64_t id) {
    try {
        int affected = queryExecutor_->executeCommand(
            "DELETE FROM " + table_ + " WHERE id = $1", {std::to_string(id)});
        return affected > 0;
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(table_ + " delete failed: " + e.what());
    }
}

// --- Mapping ---

CertificateRecord PgCertificateRepository::rowToRecord(const Json::Value& row) {
    using namespace common::db;

    CertificateRecord r;
    r.id = getInt64(row, "id");
    r.name = getString(row, "cert_name");
    r.type = getInt(row, "cert_type");
    r.certificate = getOptionalString(row, "cert_certificate");
    r.privatekey = getOptionalString(row, "cert_privatekey");
    r.csr = getOptionalString(row, "cert_csr");
    r.serial = getOptionalInt64(row, "cert_serial");
    r.signedby = getOptionalInt64(row, "cert_signedby");
    r.country = getOptionalString(row, "cert_country");
    r.state = getOptionalString(row, "cert_state");
    r.city = getOptionalString(row, "cert_city");
    r.organization = getOptionalString(row, "cert_organization");
    r.organizationalUnit = getOptionalString(row, "cert_organizational_unit");
    r.common = getOptionalString(row, "cert_common");
    r.email = getOptionalString(row, "cert_email");
    r.san = getString(row, "cert_san");
    r.keyLength = optionalInt(row, "cert_key_length");
    r.digestAlgorithm = getOptionalString(row, "cert_digest_algorithm");
    r.lifetime = optionalInt(row, "cert_lifetime");
    r.chain = getBool(row, "cert_chain");
    r.acme = getOptionalInt64(row, "cert_acme_id");
    r.acmeUri = getOptionalString(row, "cert_acme_uri");
    r.domainsAuthenticators = parseMapping(getString(row, "cert_domains_authenticators"));
    r.renewDays = optionalInt(row, "cert_renew_days");
    return r;
}

std::vector<std::string> PgCertificateRepository::recordParams(const CertificateRecord& r) {
    using namespace common::db;

    return {
        r.name,
        std::to_string(r.type),
        optionalParam(r.certificate),
        optionalParam(r.privatekey),
        optionalParam(r.csr),
        optionalParam(r.serial),
        optionalParam(r.signedby),
        optionalParam(r.country),
        optionalParam(r.state),
        optionalParam(r.city),
        optionalParam(r.organization),
        optionalParam(r.organizationalUnit),
        optionalParam(r.common),
        optionalParam(r.email),
        r.san,
        intParam(r.keyLength),
        optionalParam(r.digestAlgorithm),
        intParam(r.lifetime),
        boolParam(r.chain),
        optionalParam(r.acme),
        optionalParam(r.acmeUri),
        r.domainsAuthenticators.empty() ? std::string() : mappingToText(r.domainsAuthenticators),
        intParam(r.renewDays),
    };
}

} // namespace repositories
