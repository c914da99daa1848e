#include "dns_authenticator_repository.h"
#include "query_helpers.h"
#include "exceptions.h"

#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace repositories {

using domain::models::DnsAuthenticator;

PgDnsAuthenticatorRepository::PgDnsAuthenticatorRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("PgDnsAuthenticatorRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<DnsAuthenticator> PgDnsAuthenticatorRepository::findById(int64_t id) {
    auto rows = select(" WHERE id = $1", {std::to_string(id)});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<DnsAuthenticator> PgDnsAuthenticatorRepository::findAll() {
    return select("", {});
}

std::vector<DnsAuthenticator> PgDnsAuthenticatorRepository::select(
    const std::string& where, const std::vector<std::string>& params)
{
    using namespace common::db;

    Json::Value rows;
    try {
        rows = queryExecutor_->executeQuery(
            "SELECT id, name, authenticator, attributes FROM acme_dns_authenticator" + where +
            " ORDER BY id", params);
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(std::string("acme_dns_authenticator query failed: ") + e.what());
    }

    std::vector<DnsAuthenticator> result;
    for (const auto& row : rows) {
        DnsAuthenticator a;
        a.id = getInt64(row, "id");
        a.name = getString(row, "name");
        a.authenticator = getString(row, "authenticator");

        std::string attributes = getString(row, "attributes");
        if (!attributes.empty()) {
            Json::CharReaderBuilder builder;
            std::string errs;
            std::istringstream stream(attributes);
            if (!Json::parseFromStream(builder, stream, &a.attributes, &errs)) {
                spdlog::warn("[DnsAuthenticatorRepository] Malformed attributes for authenticator {}: {}",
                             a.id, errs);
                a.attributes = Json::Value(Json::objectValue);
            }
        }
        result.push_back(std::move(a));
    }
    return result;
}

} // namespace repositories
