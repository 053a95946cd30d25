/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool Manager
 *
 * Thread-safe connection pooling for PostgreSQL database
 * Features:
 * - Configurable pool size (min/max connections)
 * - Connection timeout handling
 * - Automatic connection health checking
 * - Connections left inside a transaction are never handed out again
 * - Thread-safe acquire/release
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
 * @brief RAII wrapper for PostgreSQL connection
 *
 * Automatically returns connection to pool when destroyed
 */
class DbConnection {
private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning pointer to pool
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

    DbConnection& operator=(DbConnection&& other) noexcept {
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

    /**
     * @brief Get raw PostgreSQL connection
     */
    PGconn* get() const { return conn_; }

    bool isValid() const {
        return conn_ != nullptr && !released_;
    }

    /**
     * @brief Execute a parameterless statement, true on success
     */
    bool execute(const std::string& sql);

    /**
     * @brief Manually release connection back to pool
     */
    void release();
};

/**
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe connection pool with configurable size and timeout
 */
class DbConnectionPool {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;  // mutable to allow locking in const methods
    std::condition_variable cv_;

    bool shutdown_;

    friend class DbConnection;

public:
    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    /**
     * @param connString PostgreSQL connection string
     * @param minSize Minimum number of connections to maintain
     * @param maxSize Maximum number of connections allowed
     * @param acquireTimeoutSec Timeout for acquiring connection (seconds)
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 2,
        size_t maxSize = 10,
        int acquireTimeoutSec = 5
    );

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open the minimum number of connections
     * @return true if successfully created minimum connections
     */
    bool initialize();

    /**
     * @brief Acquire connection from pool
     * @throws common::PoolExhaustedException on timeout
     * @throws common::DatabaseException on pool shutdown or connect failure
     */
    DbConnection acquire();

    Stats getStats() const;

    /**
     * @brief Shutdown pool and close all idle connections
     */
    void shutdown();

private:
    PGconn* createConnection();

    /**
     * @brief Connection is OK, idle (not inside a transaction) and answers a ping
     */
    bool isConnectionHealthy(PGconn* conn);

    /**
     * @brief Return connection to pool (called by DbConnection)
     */
    void releaseConnection(PGconn* conn);
};

} // namespace common
