#pragma once

#include <libpq-fe.h>
#include <json/json.h>
#include <memory>
#include <string>
#include <vector>

/**
 * @file pg_result.h
 * @brief libpq result helpers shared by the query executor and transactions
 *
 * Centralises parameter binding, error classification (SQLSTATE to typed
 * exception) and PGresult to JSON conversion so every statement path behaves
 * the same way.
 */

namespace common::pg {

/// PGresult owned by a smart pointer; PQclear runs on scope exit
using PgResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

/// SQLSTATE class 23 codes this layer classifies
constexpr const char* SQLSTATE_UNIQUE_VIOLATION = "23505";
constexpr const char* SQLSTATE_FOREIGN_KEY_VIOLATION = "23503";

/**
 * @brief Execute a parameterised statement on an open connection
 *
 * Parameters are sent as text. An empty string is bound as SQL NULL
 * (columns that must never be NULL coalesce in SQL).
 *
 * @param conn Open PostgreSQL connection
 * @param sql Statement with $1, $2 placeholders
 * @param params Statement parameters
 * @return Result with status PGRES_COMMAND_OK or PGRES_TUPLES_OK
 * @throws common::UniqueViolationException on SQLSTATE 23505
 * @throws common::ForeignKeyViolationException on SQLSTATE 23503
 * @throws common::DatabaseException on any other failure
 */
PgResultPtr execParams(PGconn* conn, const std::string& sql,
                       const std::vector<std::string>& params);

/**
 * @brief Number of rows affected by a command result (PQcmdTuples)
 */
int affectedRows(const PGresult* res);

/**
 * @brief Convert a result set to a JSON array of row objects
 *
 * Type conversion by column OID:
 * - INT2, INT4 -> Int, INT8 -> Int64
 * - FLOAT4, FLOAT8 -> double
 * - BOOL -> bool
 * - NULL -> null
 * - everything else -> string
 */
Json::Value resultToJson(const PGresult* res);

} // namespace common::pg
