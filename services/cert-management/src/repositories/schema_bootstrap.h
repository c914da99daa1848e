/**
 * @file schema_bootstrap.h
 * @brief Creates the certificate management tables if they are missing
 */

#pragma once

#include "i_query_executor.h"

#include <string>
#include <vector>

namespace repositories {

class SchemaBootstrap {
public:
    explicit SchemaBootstrap(common::IQueryExecutor* queryExecutor);

    /**
     * @brief Execute every CREATE ... IF NOT EXISTS statement in dependency order
     * @throws common::DatabaseException on the first failing statement
     */
    void ensureSchema();

    /// DDL statements, one per element
    static const std::vector<std::string>& statements();

private:
    common::IQueryExecutor* queryExecutor_;
};

} // namespace repositories
