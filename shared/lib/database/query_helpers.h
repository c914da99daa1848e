#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Row extraction and parameter helpers for repository code
 *
 * IQueryExecutor returns rows as Json::Value objects. Column values arrive
 * as native JSON types for known PostgreSQL OIDs and as strings otherwise,
 * so the getters below accept either representation.
 *
 * Usage:
 *   auto id = common::db::getInt64(row, "id");
 *   auto serial = common::db::getOptionalInt64(row, "cert_serial");
 *   params.push_back(common::db::optionalParam(record.csr));
 *
 * @date 2026-02-17
 */

namespace common::db {

// ============================================================================
// JSON Value Extraction
// ============================================================================

/**
 * @brief Extract integer from JSON value with type-safe conversion
 * @return Extracted integer value, or @p defaultValue if missing, null, or unparseable
 */
int getInt(const Json::Value& json, const std::string& field, int defaultValue = 0);

/**
 * @brief Extract 64-bit integer (BIGINT / BIGSERIAL columns)
 */
int64_t getInt64(const Json::Value& json, const std::string& field, int64_t defaultValue = 0);

/**
 * @brief Extract nullable 64-bit integer
 * @return std::nullopt for SQL NULL or an unparseable value
 */
std::optional<int64_t> getOptionalInt64(const Json::Value& json, const std::string& field);

/**
 * @brief Extract boolean from JSON value
 *
 * Handles PostgreSQL boolean (true/false) and textual "t"/"f" forms.
 */
bool getBool(const Json::Value& json, const std::string& field, bool defaultValue = false);

/**
 * @brief Extract string; SQL NULL yields @p defaultValue
 */
std::string getString(const Json::Value& json, const std::string& field,
                      const std::string& defaultValue = "");

/**
 * @brief Extract nullable string
 */
std::optional<std::string> getOptionalString(const Json::Value& json, const std::string& field);

/**
 * @brief Convert a scalar JSON value to a 64-bit integer
 *
 * Used with IQueryExecutor::executeScalar() and INSERT ... RETURNING results.
 */
int64_t scalarToInt64(const Json::Value& value, int64_t defaultValue = 0);

// ============================================================================
// Parameter Encoding
// ============================================================================

/// PostgreSQLQueryExecutor binds empty parameters as SQL NULL
std::string optionalParam(const std::optional<std::string>& value);

std::string optionalParam(const std::optional<int64_t>& value);

std::string boolParam(bool value);

} // namespace common::db
