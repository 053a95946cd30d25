#pragma once

#include "db_connection_pool.h"
#include <json/json.h>
#include <string>
#include <vector>

/**
 * @file pg_transaction.h
 * @brief Scoped PostgreSQL transaction on one pooled connection
 *
 * BEGIN runs on construction. Unless commit() succeeds, the destructor issues
 * ROLLBACK before the connection goes back to the pool.
 */

namespace common {

class PgTransaction {
public:
    /**
     * @param pool Pool the connection is acquired from
     * @throws common::PoolExhaustedException, common::DatabaseException
     */
    explicit PgTransaction(DbConnectionPool& pool);

    ~PgTransaction();

    PgTransaction(const PgTransaction&) = delete;
    PgTransaction& operator=(const PgTransaction&) = delete;

    /**
     * @brief Run a row-returning statement inside the transaction
     * @return JSON array of rows (see pg::resultToJson)
     */
    Json::Value query(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Run a command inside the transaction
     * @return Number of affected rows
     */
    int command(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @throws common::DatabaseException if COMMIT fails (the transaction is then closed)
     */
    void commit();

    void rollback() noexcept;

    bool isActive() const { return active_; }

private:
    void ensureActive() const;

    DbConnection conn_;
    bool active_;
};

} // namespace common
