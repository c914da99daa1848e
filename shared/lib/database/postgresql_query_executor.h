#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>
#include <memory>

/**
 * @file postgresql_query_executor.h
 * @brief PostgreSQL Query Executor - libpq-based implementation
 *
 * Acquires a pooled connection per call, binds parameters through
 * PQexecParams and converts PGresult rows to Json::Value.
 *
 * @date 2026-02-04
 */

namespace common {

/**
 * @brief PostgreSQL-specific query executor
 */
class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool PostgreSQL connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "postgres"; }

private:
    struct PgResultDeleter { void operator()(PGresult* r) const { PQclear(r); } };
    using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

    DbConnectionPool* pool_;  ///< Non-owning

    /**
     * @brief Execute a parameterized statement on a pooled connection
     * @throws DatabaseException on acquisition or execution failure
     */
    PgResultPtr executeRaw(const std::string& query, const std::vector<std::string>& params);

    /**
     * @brief Convert one cell by PostgreSQL type OID
     *
     * INT2/INT4/INT8 -> integer, FLOAT4/FLOAT8/NUMERIC -> double,
     * BOOL -> bool, NULL -> null, everything else -> string.
     */
    static Json::Value cellToJson(PGresult* res, int row, int col);

    static Json::Value pgResultToJson(PGresult* res);
};

} // namespace common
