/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe libpq connection pool with bounded size, acquire timeout and
 * health checking on acquire and release.
 *
 * @date 2026-02-02
 */

#pragma once

#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>
#include <atomic>

namespace common {

class DbConnectionPool;

/**
 * @brief RAII wrapper for a pooled PostgreSQL connection
 *
 * Returns the connection to its pool when destroyed.
 */
class DbConnection {
private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
    bool released_;

public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool), released_(false) {}

    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_), released_(other.released_) {
        other.conn_ = nullptr;
        other.released_ = true;
    }

    DbConnection& operator=(DbConnection&& other) noexcept;

    PGconn* get() const { return conn_; }

    bool isValid() const { return conn_ != nullptr && !released_; }

    /**
     * @brief Return the connection to the pool before scope exit
     */
    void release();
};

/**
 * @brief Pool statistics snapshot
 */
struct DbPoolStats {
    size_t availableConnections;
    size_t totalConnections;
    size_t maxConnections;
};

/**
 * @brief PostgreSQL Connection Pool
 */
class DbConnectionPool {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class DbConnection;

public:
    /**
     * @param connString libpq connection string
     * @param minSize Connections opened by initialize()
     * @param maxSize Upper bound on open connections
     * @param acquireTimeoutSec Wait bound for acquire() when the pool is exhausted
     * @throws std::invalid_argument if minSize > maxSize
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 1,
        size_t maxSize = 5,
        int acquireTimeoutSec = 5
    );

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Build a libpq keyword/value connection string
     */
    static std::string buildConnString(const std::string& host, int port,
                                       const std::string& dbName,
                                       const std::string& user,
                                       const std::string& password);

    /**
     * @brief Open the minimum number of connections
     * @return false if any of them could not be opened (details logged)
     */
    bool initialize();

    /**
     * @brief Acquire a connection
     * @throws PoolExhaustedException on timeout
     * @throws std::runtime_error after shutdown or when a new connection fails
     */
    DbConnection acquire();

    DbPoolStats getStats() const;

    void shutdown();

private:
    PGconn* createConnection();
    bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);
};

} // namespace common
