#include "system_settings_repository.h"
#include "query_helpers.h"
#include "exceptions.h"

#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace repositories {

PgSystemSettingsRepository::PgSystemSettingsRepository(common::IQueryExecutor* queryExecutor)
    : queryExecutor_(queryExecutor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("PgSystemSettingsRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<int64_t> PgSystemSettingsRepository::getUiCertificateId() {
    try {
        Json::Value rows = queryExecutor_->executeQuery(
            "SELECT ui_certificate_id FROM system_settings WHERE id = 1");
        if (rows.empty()) return std::nullopt;
        return common::db::getOptionalInt64(rows[0], "ui_certificate_id");
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(std::string("system_settings query failed: ") + e.what());
    }
}

void PgSystemSettingsRepository::setUiCertificateId(int64_t certificateId) {
    try {
        queryExecutor_->executeCommand(
            "INSERT INTO system_settings (id, ui_certificate_id) VALUES (1, $1) "
            "ON CONFLICT (id) DO UPDATE SET ui_certificate_id = EXCLUDED.ui_certificate_id",
            {std::to_string(certificateId)});
        spdlog::info("[SystemSettingsRepository] UI certificate set to {}", certificateId);
    } catch (const common::DatabaseException&) {
        throw;
    } catch (const std::exception& e) {
        throw common::DatabaseException(std::string("system_settings update failed: ") + e.what());
    }
}

} // namespace repositories
