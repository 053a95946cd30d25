/**
 * @file pg_transaction.cpp
 * @brief Scoped PostgreSQL transaction
 */

#include "pg_transaction.h"
#include "pg_result.h"
#include "../exception/exceptions.h"
#include <spdlog/spdlog.h>

namespace common {

PgTransaction::PgTransaction(DbConnectionPool& pool)
    : conn_(pool.acquire()), active_(false)
{
    pg::execParams(conn_.get(), "BEGIN", {});
    active_ = true;
    spdlog::trace("[PgTransaction] BEGIN");
}

PgTransaction::~PgTransaction() {
    if (active_) {
        rollback();
    }
}

Json::Value PgTransaction::query(const std::string& sql, const std::vector<std::string>& params) {
    ensureActive();
    auto res = pg::execParams(conn_.get(), sql, params);
    return pg::resultToJson(res.get());
}

int PgTransaction::command(const std::string& sql, const std::vector<std::string>& params) {
    ensureActive();
    auto res = pg::execParams(conn_.get(), sql, params);
    return pg::affectedRows(res.get());
}

void PgTransaction::commit() {
    ensureActive();
    try {
        pg::execParams(conn_.get(), "COMMIT", {});
    } catch (const DatabaseException&) {
        // COMMIT failure leaves the server transaction aborted or closed
        rollback();
        throw;
    }
    active_ = false;
    spdlog::trace("[PgTransaction] COMMIT");
}

void PgTransaction::rollback() noexcept {
    if (!active_) {
        return;
    }
    active_ = false;
    if (!conn_.execute("ROLLBACK")) {
        spdlog::warn("[PgTransaction] ROLLBACK failed; connection will be discarded by the pool");
    } else {
        spdlog::trace("[PgTransaction] ROLLBACK");
    }
}

void PgTransaction::ensureActive() const {
    if (!active_) {
        throw DatabaseException("transaction is no longer active");
    }
}

} // namespace common
