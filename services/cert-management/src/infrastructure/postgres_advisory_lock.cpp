/**
 * @file postgres_advisory_lock.cpp
 * @brief PostgresAdvisoryLock implementation
 */

#include "postgres_advisory_lock.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace infrastructure {

namespace {

/// "CERTMGR" in the high bytes keeps the keys clear of other applications
constexpr int64_t kAdvisoryKeyBase = 0x434552544D475200LL;

struct PgResultDeleter { void operator()(PGresult* r) const { PQclear(r); } };
using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

} // anonymous namespace

PostgresAdvisoryLock::PostgresAdvisoryLock(std::string connString)
    : connString_(std::move(connString)) {}

int64_t PostgresAdvisoryLock::advisoryKey(OperationCategory category) {
    return kAdvisoryKeyBase + static_cast<int64_t>(category);
}

PGconn* PostgresAdvisoryLock::connectionFor(OperationCategory category) {
    PgConnPtr& slot = connections_[static_cast<size_t>(category)];
    if (slot && PQstatus(slot.get()) == CONNECTION_OK) {
        return slot.get();
    }

    slot.reset(PQconnectdb(connString_.c_str()));
    if (!slot || PQstatus(slot.get()) != CONNECTION_OK) {
        std::string error = slot ? PQerrorMessage(slot.get()) : "out of memory";
        slot.reset();
        throw common::DatabaseException("advisory lock connection failed: " + error);
    }
    return slot.get();
}

bool PostgresAdvisoryLock::runLockFunction(PGconn* conn, const char* function,
                                           OperationCategory category) {
    const std::string key = std::to_string(advisoryKey(category));
    const std::string query = std::string("SELECT ") + function + "($1::bigint)";
    const char* values[] = {key.c_str()};

    PgResultPtr res(PQexecParams(conn, query.c_str(), 1, nullptr, values, nullptr, nullptr, 0));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        return false;
    }
    // pg_advisory_lock returns void; pg_advisory_unlock returns false if the lock was not held
    if (PQnfields(res.get()) == 1 && PQntuples(res.get()) == 1 && !PQgetisnull(res.get(), 0, 0)) {
        const char* value = PQgetvalue(res.get(), 0, 0);
        if (value[0] == 'f') return false;
    }
    return true;
}

void PostgresAdvisoryLock::lock(OperationCategory category) {
    PGconn* conn = connectionFor(category);
    if (!runLockFunction(conn, "pg_advisory_lock", category)) {
        std::string error = PQerrorMessage(conn);
        connections_[static_cast<size_t>(category)].reset();
        throw common::DatabaseException("pg_advisory_lock failed: " + error);
    }
    spdlog::debug("[PostgresAdvisoryLock] Locked category {} (key {})",
                  static_cast<size_t>(category), advisoryKey(category));
}

void PostgresAdvisoryLock::unlock(OperationCategory category) {
    PgConnPtr& slot = connections_[static_cast<size_t>(category)];
    if (!slot) return;

    if (!runLockFunction(slot.get(), "pg_advisory_unlock", category)) {
        std::string error = PQerrorMessage(slot.get());
        // Closing the session releases every advisory lock it still holds
        slot.reset();
        throw common::DatabaseException("pg_advisory_unlock failed: " + error);
    }
    spdlog::debug("[PostgresAdvisoryLock] Unlocked category {}", static_cast<size_t>(category));
}

} // namespace infrastructure
