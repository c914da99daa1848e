#include "postgresql_query_executor.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>
#include "exceptions.h"

namespace common {

namespace {

// PostgreSQL type OIDs (pg_type.h)
constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} ({} params)", query, params.size());
    PgResultPtr res = executeRaw(query, params);
    return pgResultToJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Command: {} ({} params)", query, params.size());
    PgResultPtr res = executeRaw(query, params);

    const char* affectedRowsStr = PQcmdTuples(res.get());
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }
    return affectedRows;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params)
{
    PgResultPtr res = executeRaw(query, params);

    if (PQntuples(res.get()) == 0) {
        throw DatabaseException("Scalar query returned no rows");
    }
    if (PQnfields(res.get()) != 1) {
        throw DatabaseException("Scalar query must return exactly one column");
    }
    return cellToJson(res.get(), 0, 0);
}

// ============================================================================
// Private Implementation
// ============================================================================

PostgreSQLQueryExecutor::PgResultPtr PostgreSQLQueryExecutor::executeRaw(
    const std::string& query,
    const std::vector<std::string>& params)
{
    // RAII - connection returns to the pool when this function exits
    auto conn = pool_->acquire();
    if (!conn.isValid()) {
        throw DatabaseException("Failed to acquire connection from pool");
    }

    // Empty strings are bound as SQL NULL
    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PgResultPtr res(PQexecParams(
        conn.get(),
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,            // infer parameter types
        paramValues.data(),
        nullptr,            // text parameters
        nullptr,
        0                   // text results
    ));

    if (!res) {
        throw DatabaseException("Query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throw DatabaseException(std::string("Query failed: ") +
                                 PQerrorMessage(conn.get()));
    }

    return res;
}

Json::Value PostgreSQLQueryExecutor::cellToJson(PGresult* res, int row, int col) {
    if (PQgetisnull(res, row, col)) {
        return Json::nullValue;
    }

    const char* value = PQgetvalue(res, row, col);
    switch (PQftype(res, col)) {
        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
            return Json::Value(static_cast<Json::Int64>(std::strtoll(value, nullptr, 10)));
        case kFloat4Oid:
        case kFloat8Oid:
            return Json::Value(std::atof(value));
        case kBoolOid:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

Json::Value PostgreSQLQueryExecutor::pgResultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            row[PQfname(res, j)] = cellToJson(res, i, j);
        }
        array.append(row);
    }

    return array;
}

} // namespace common
