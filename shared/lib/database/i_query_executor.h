#pragma once

#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface - autocommit query execution
 *
 * Repositories issue single statements through this interface and receive
 * rows in a standardized JSON format. Multi-statement units of work use
 * common::PgTransaction instead.
 */

namespace common {

/**
 * @brief Query Executor Interface
 *
 * Abstracts the database API (PQexecParams) away from repository code so
 * repositories can be tested with a fake executor.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute SELECT query and return results as JSON array
     *
     * @param query SQL query string with $1, $2 placeholders
     * @param params Query parameters (optional)
     * @return Json::Value Array of result rows, each row is a JSON object with column name-value pairs
     *
     * Example result:
     * [
     *   {"id": "0b6f...", "original_filename": "a.txt", "size": 5},
     *   {"id": "5c1e...", "original_filename": "b.txt", "size": 12}
     * ]
     *
     * @throws common::DatabaseException on query execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE/DDL command
     *
     * @return Number of affected rows
     * @throws common::DatabaseException on command execution failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute query and return single scalar value
     *
     * Example: executeScalar("SELECT COUNT(*) FROM stored_file") -> 42
     *
     * @throws common::DatabaseException if query returns no rows or multiple columns
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Get database type (for diagnostic purposes)
     */
    virtual std::string getDatabaseType() const = 0;
};

} // namespace common
