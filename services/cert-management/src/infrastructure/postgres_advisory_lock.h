#pragma once

/**
 * @file postgres_advisory_lock.h
 * @brief Cross-process operation locks on PostgreSQL session advisory locks
 *
 * Every process working on the same database (the serve daemon and any
 * one-shot CLI command) maps an operation category to the same advisory
 * key, so the per-category exclusion holds across processes.
 *
 * Session locks are tied to the connection that took them, so each category
 * gets its own dedicated connection outside the query pool. If an unlock
 * fails the connection is closed, which drops the lock server side.
 *
 * @date 2026-03-02
 */

#include "operation_locks.h"

#include <libpq-fe.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace infrastructure {

class PostgresAdvisoryLock : public IInterprocessLock {
public:
    /// @param connString libpq connection string (DbConnectionPool::buildConnString)
    explicit PostgresAdvisoryLock(std::string connString);
    ~PostgresAdvisoryLock() override = default;

    PostgresAdvisoryLock(const PostgresAdvisoryLock&) = delete;
    PostgresAdvisoryLock& operator=(const PostgresAdvisoryLock&) = delete;

    /// @throws common::DatabaseException if the connection or the lock call fails
    void lock(OperationCategory category) override;

    /// @throws common::DatabaseException if the unlock call fails
    void unlock(OperationCategory category) override;

    /// Advisory key shared by every process for @p category
    static int64_t advisoryKey(OperationCategory category);

private:
    struct PgConnDeleter { void operator()(PGconn* c) const { PQfinish(c); } };
    using PgConnPtr = std::unique_ptr<PGconn, PgConnDeleter>;

    PGconn* connectionFor(OperationCategory category);
    bool runLockFunction(PGconn* conn, const char* function, OperationCategory category);

    std::string connString_;
    std::array<PgConnPtr, static_cast<size_t>(OperationCategory::Count_)> connections_;
};

} // namespace infrastructure
