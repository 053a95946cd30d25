/**
 * @file pg_result.cpp
 * @brief libpq result helpers
 */

#include "pg_result.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>

namespace common::pg {

namespace {

constexpr Oid OID_BOOL = 16;
constexpr Oid OID_INT8 = 20;
constexpr Oid OID_INT2 = 21;
constexpr Oid OID_INT4 = 23;
constexpr Oid OID_FLOAT4 = 700;
constexpr Oid OID_FLOAT8 = 701;

std::string errorField(const PGresult* res, int field) {
    const char* value = res ? PQresultErrorField(res, field) : nullptr;
    return value ? std::string(value) : std::string();
}

[[noreturn]] void throwForResult(PGconn* conn, const PGresult* res) {
    std::string sqlState = errorField(res, PG_DIAG_SQLSTATE);
    std::string constraint = errorField(res, PG_DIAG_CONSTRAINT_NAME);
    std::string message = res ? PQresultErrorMessage(res) : PQerrorMessage(conn);

    if (sqlState == SQLSTATE_UNIQUE_VIOLATION) {
        spdlog::debug("[pg] Unique violation on {}", constraint);
        throw UniqueViolationException(message, constraint);
    }
    if (sqlState == SQLSTATE_FOREIGN_KEY_VIOLATION) {
        spdlog::debug("[pg] Foreign key violation on {}", constraint);
        throw ForeignKeyViolationException(message, constraint);
    }
    throw DatabaseException(message, sqlState);
}

} // namespace

PgResultPtr execParams(PGconn* conn, const std::string& sql,
                       const std::vector<std::string>& params) {
    if (!conn) {
        throw DatabaseException("no connection");
    }

    spdlog::trace("[pg] Query: {}", sql);
    for (size_t i = 0; i < params.size(); ++i) {
        spdlog::trace("[pg] Param[{}]: '{}'", i, params[i]);
    }

    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PgResultPtr res(
        PQexecParams(
            conn,
            sql.c_str(),
            static_cast<int>(params.size()),
            nullptr,                    // Parameter types (nullptr = infer)
            paramValues.data(),
            nullptr,                    // Parameter lengths (nullptr = text)
            nullptr,                    // Parameter formats (nullptr = text)
            0                           // Result format (0 = text)
        ),
        &PQclear
    );

    if (!res) {
        throw DatabaseException(std::string("query execution failed: ") + PQerrorMessage(conn));
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throwForResult(conn, res.get());
    }

    return res;
}

int affectedRows(const PGresult* res) {
    const char* affected = PQcmdTuples(const_cast<PGresult*>(res));
    if (!affected || affected[0] == '\0') {
        return 0;
    }
    return std::atoi(affected);
}

Json::Value resultToJson(const PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            const char* value = PQgetvalue(res, i, j);
            Oid type = PQftype(res, j);

            if (type == OID_INT2 || type == OID_INT4) {
                row[fieldName] = std::atoi(value);
            } else if (type == OID_INT8) {
                row[fieldName] = static_cast<Json::Int64>(std::strtoll(value, nullptr, 10));
            } else if (type == OID_FLOAT4 || type == OID_FLOAT8) {
                row[fieldName] = std::atof(value);
            } else if (type == OID_BOOL) {
                row[fieldName] = (value[0] == 't');
            } else {
                row[fieldName] = value;
            }
        }
        array.append(row);
    }

    return array;
}

} // namespace common::pg
