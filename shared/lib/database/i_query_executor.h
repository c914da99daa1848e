#pragma once

#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface - backend-agnostic query execution
 *
 * Repositories talk to the database only through this interface and receive
 * results as Json::Value rows. The production implementation is libpq-based
 * (PostgreSQLQueryExecutor); tests substitute recording fakes.
 *
 * @date 2026-02-04
 */

namespace common {

/**
 * @brief Query Executor Interface
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute SELECT (or INSERT ... RETURNING) and return rows
     *
     * @param query SQL with $1, $2 placeholders
     * @param params Query parameters; an empty string binds SQL NULL
     * @return Json::Value array of row objects keyed by column name
     *
     * Example result:
     * [
     *   {"id": 3, "cert_name": "web", "cert_serial": 7},
     *   {"id": 4, "cert_name": "vpn", "cert_serial": null}
     * ]
     *
     * @throws std::runtime_error on query execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE/DDL command
     * @return Number of affected rows
     * @throws std::runtime_error on command execution failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute query and return single scalar value
     *
     * Example: executeScalar("SELECT COUNT(*) FROM system_certificate") -> 42
     *
     * @throws std::runtime_error if query returns no rows or multiple columns
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Get database type (for diagnostic purposes)
     */
    virtual std::string getDatabaseType() const = 0;
};

} // namespace common
