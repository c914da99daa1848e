/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// =============================================================================
// DbConnection
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

DbConnection& DbConnection::operator=(DbConnection&& other) noexcept {
    if (this != &other) {
        if (!released_ && conn_) {
            release();
        }
        conn_ = other.conn_;
        pool_ = other.pool_;
        released_ = other.released_;
        other.conn_ = nullptr;
        other.released_ = true;
    }
    return *this;
}

void DbConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (minSize > maxSize) {
        throw std::invalid_argument("DbConnectionPool: minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

std::string DbConnectionPool::buildConnString(const std::string& host, int port,
                                              const std::string& dbName,
                                              const std::string& user,
                                              const std::string& password) {
    // Values are single-quoted per libpq keyword/value syntax
    auto quote = [](const std::string& value) {
        std::string out = "'";
        for (char c : value) {
            if (c == '\'' || c == '\\') out += '\\';
            out += c;
        }
        return out + "'";
    };

    return "host=" + quote(host) +
           " port=" + std::to_string(port) +
           " dbname=" + quote(dbName) +
           " user=" + quote(user) +
           " password=" + quote(password);
}

bool DbConnectionPool::initialize() {
    spdlog::info("[DbConnectionPool] Opening {} initial connection(s)", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to create connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw std::runtime_error("Connection pool is shutdown");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                return DbConnection(conn, this);
            }

            spdlog::warn("[DbConnectionPool] Pooled connection is unhealthy, closing");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (!conn) {
                throw std::runtime_error("Failed to create database connection");
            }
            totalConnections_++;
            return DbConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

DbPoolStats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return DbPoolStats{availableConnections_.size(), totalConnections_.load(), maxSize_};
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PQfinish(availableConnections_.front());
        availableConnections_.pop();
    }
    totalConnections_ = 0;

    cv_.notify_all();
    spdlog::info("[DbConnectionPool] Shutdown complete");
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }

    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) {
        PQclear(res);
    }
    return ok;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_ || !isConnectionHealthy(conn)) {
        PQfinish(conn);
        if (totalConnections_ > 0) totalConnections_--;
    } else {
        availableConnections_.push(conn);
    }

    cv_.notify_one();
}

} // namespace common
