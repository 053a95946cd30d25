#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"

/**
 * @file postgresql_query_executor.h
 * @brief PostgreSQL Query Executor - libpq-based implementation
 *
 * Implements IQueryExecutor using PostgreSQL libpq API.
 * Handles connection acquisition from pool, query execution,
 * result parsing, and JSON conversion.
 */

namespace common {

/**
 * @brief PostgreSQL-specific query executor
 *
 * Uses DbConnectionPool for connection management and the pg_result helpers
 * for execution, so constraint violations surface as typed exceptions.
 */
class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool PostgreSQL connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "postgres"; }

private:
    DbConnectionPool* pool_;  ///< PostgreSQL connection pool
};

} // namespace common
