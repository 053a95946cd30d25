/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// =============================================================================
// DbConnection Implementation
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

bool DbConnection::execute(const std::string& sql) {
    if (!isValid()) {
        return false;
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        spdlog::warn("[DbConnection] '{}' failed: {}", sql, PQresultErrorMessage(res));
    }
    PQclear(res);

    return (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
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
// DbConnectionPool Implementation
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
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }
    if (maxSize == 0) {
        throw std::invalid_argument("maxSize must be at least 1");
    }

    spdlog::info("[DbConnectionPool] Created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    spdlog::info("[DbConnectionPool] Initializing with {} minimum connections", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to create minimum connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                spdlog::debug("[DbConnectionPool] Acquired connection (available: {})", availableConnections_.size());
                return DbConnection(conn, this);
            }

            spdlog::warn("[DbConnectionPool] Pooled connection is unhealthy, closing and retrying");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        // No idle connection - open a new one if under max
        if (totalConnections_ < maxSize_) {
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (conn) {
                spdlog::info("[DbConnectionPool] Created new connection (total: {})", totalConnections_.load());
                return DbConnection(conn, this);
            }

            totalConnections_--;
            throw DatabaseException("failed to create database connection");
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[DbConnectionPool] Timeout waiting for connection (timeout: {}s)", acquireTimeout_.count());
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return Stats{
        availableConnections_.size(),
        totalConnections_.load(),
        maxSize_
    };
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    spdlog::info("[DbConnectionPool] Shutting down");
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PGconn* conn = availableConnections_.front();
        availableConnections_.pop();
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_all();
}

PGconn* DbConnectionPool::createConnection() {
    spdlog::debug("[DbConnectionPool] Creating new PostgreSQL connection");

    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::error("[DbConnectionPool] Failed to create PostgreSQL connection: {}", error);
        PQfinish(conn);
        return nullptr;
    }

    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn) {
        return false;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::debug("[DbConnectionPool] Connection status is not OK");
        return false;
    }

    // A connection still inside a transaction must not be reused
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("[DbConnectionPool] Connection is not idle (open transaction)");
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    if (!res || PQresultStatus(res) != PGRES_TUPLES_OK) {
        if (res) {
            PQclear(res);
        }
        spdlog::debug("[DbConnectionPool] Health check query failed");
        return false;
    }

    PQclear(res);
    return true;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        totalConnections_--;
        return;
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
        spdlog::debug("[DbConnectionPool] Connection returned (available: {})", availableConnections_.size());
    } else {
        spdlog::warn("[DbConnectionPool] Released connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace common
