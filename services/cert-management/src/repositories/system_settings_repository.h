/**
 * @file system_settings_repository.h
 * @brief Repository Interface - system-wide settings (system_settings)
 *
 * Holds the certificate currently serving the administrative HTTPS UI.
 */

#pragma once

#include "i_query_executor.h"

#include <cstdint>
#include <optional>

namespace repositories {

class ISystemSettingsRepository {
public:
    virtual ~ISystemSettingsRepository() = default;

    virtual std::optional<int64_t> getUiCertificateId() = 0;

    virtual void setUiCertificateId(int64_t certificateId) = 0;
};

class PgSystemSettingsRepository : public ISystemSettingsRepository {
public:
    explicit PgSystemSettingsRepository(common::IQueryExecutor* queryExecutor);

    std::optional<int64_t> getUiCertificateId() override;
    void setUiCertificateId(int64_t certificateId) override;

private:
    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
