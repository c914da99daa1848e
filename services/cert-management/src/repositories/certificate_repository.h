/**
 * @file certificate_repository.h
 * @brief Repository Interface - Certificate / Certificate Authority rows
 *
 * One interface serves both stores; a PostgreSQL instance is bound to either
 * system_certificate or system_certificateauthority at construction.
 *
 * @date 2026-02-18
 */

#pragma once

#include "../domain/models/certificate_record.h"
#include "i_query_executor.h"

#include <optional>
#include <string>
#include <vector>

namespace repositories {

/**
 * @brief Certificate Repository Interface
 *
 * Implementations are PostgreSQL-based in production and in-memory in tests.
 */
class ICertificateRepository {
public:
    virtual ~ICertificateRepository() = default;

    virtual std::optional<domain::models::CertificateRecord> findById(int64_t id) = 0;

    virtual std::optional<domain::models::CertificateRecord> findByName(const std::string& name) = 0;

    /// All rows ordered by id
    virtual std::vector<domain::models::CertificateRecord> findAll() = 0;

    /// Rows whose signedby references CA @p caId
    virtual std::vector<domain::models::CertificateRecord> findBySignedBy(int64_t caId) = 0;

    /// Rows carrying an ACME registration reference
    virtual std::vector<domain::models::CertificateRecord> findAcmeIssued() = 0;

    /**
     * @brief Insert a new row
     * @return Generated id
     * @throws common::DatabaseException on failure
     */
    virtual int64_t insert(const domain::models::CertificateRecord& record) = 0;

    /// Overwrite every column of row @c record.id
    virtual void update(const domain::models::CertificateRecord& record) = 0;

    /// @return false if no row had that id
    virtual bool remove(int64_t id) = 0;
};

/**
 * @brief PostgreSQL implementation over IQueryExecutor
 *
 * Columns carry the "cert_" prefix; domains_authenticators is a JSON text column.
 */
class PgCertificateRepository : public ICertificateRepository {
public:
    /**
     * @param queryExecutor Non-owning
     * @param store Table selector
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    PgCertificateRepository(common::IQueryExecutor* queryExecutor, domain::models::Store store);
    ~PgCertificateRepository() override = default;

    std::optional<domain::models::CertificateRecord> findById(int64_t id) override;
    std::optional<domain::models::CertificateRecord> findByName(const std::string& name) override;
    std::vector<domain::models::CertificateRecord> findAll() override;
    std::vector<domain::models::CertificateRecord> findBySignedBy(int64_t caId) override;
    std::vector<domain::models::CertificateRecord> findAcmeIssued() override;
    int64_t insert(const domain::models::CertificateRecord& record) override;
    void update(const domain::models::CertificateRecord& record) override;
    bool remove(int64_t id) override;

    /// Row -> record conversion, exposed for tests
    static domain::models::CertificateRecord rowToRecord(const Json::Value& row);

private:
    std::vector<domain::models::CertificateRecord> selectWhere(
        const std::string& where, const std::vector<std::string>& params);

    /// Parameters $1..$23 in column order (id excluded)
    static std::vector<std::string> recordParams(const domain::models::CertificateRecord& record);

    common::IQueryExecutor* queryExecutor_;
    std::string table_;
};

} // namespace repositories
