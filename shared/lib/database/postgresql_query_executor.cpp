#include "postgresql_query_executor.h"
#include "pg_result.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// ============================================================================
// Constructor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Executing SELECT query ({} params)", params.size());

    // Acquire connection from pool (RAII - held until function returns)
    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);

    // Convert to JSON while connection is still valid
    return pg::resultToJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Executing command");

    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);

    int affected = pg::affectedRows(res.get());
    spdlog::debug("[PostgreSQLQueryExecutor] Command executed, affected rows: {}", affected);
    return affected;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Executing scalar query");

    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);

    if (PQntuples(res.get()) == 0) {
        throw DatabaseException("scalar query returned no rows");
    }
    if (PQnfields(res.get()) != 1) {
        throw DatabaseException("scalar query must return exactly one column");
    }

    Json::Value rows = pg::resultToJson(res.get());
    const Json::Value& row = rows[0];
    return row[row.getMemberNames().front()];
}

} // namespace common
