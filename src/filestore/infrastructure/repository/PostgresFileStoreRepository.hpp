/**
 * @file PostgresFileStoreRepository.hpp
 * @brief PostgreSQL implementation of the file store repository
 */

#pragma once

#include "../../domain/repository/IFileStoreRepository.hpp"
#include "shared/lib/database/db_connection_pool.h"
#include "shared/lib/database/i_query_executor.h"
#include <json/json.h>
#include <memory>

namespace filestore::infrastructure::repository {

using namespace filestore::domain::repository;
using namespace filestore::domain::model;

/**
 * @brief PostgreSQL implementation of the file store repository
 *
 * Transactions run on one pooled connection (common::PgTransaction). Reads
 * outside a transaction go through the query executor. Integrity rules live
 * in the schema (see ensureSchema()); violations surface as the typed
 * exceptions thrown by common::pg::execParams.
 */
class PostgresFileStoreRepository : public IFileStoreRepository {
public:
    /**
     * @param pool Pool used for transactions
     * @param queryExecutor Executor used for autocommit reads
     * @throws std::invalid_argument if either is null
     */
    PostgresFileStoreRepository(
        std::shared_ptr<common::DbConnectionPool> pool,
        std::shared_ptr<common::IQueryExecutor> queryExecutor
    );

    /**
     * @brief Create tables, constraints and indexes if they do not exist
     */
    void ensureSchema();

    std::unique_ptr<IFileStoreTransaction> begin() override;

    std::optional<StoredFile> findFileById(const FileId& id) override;

    Page<StoredFile> findFiles(const FileQuery& query) override;

    std::vector<FileReference> findReferences(const std::optional<FileId>& originalFileId) override;

    StorageStatistics getStatistics() override;

    std::vector<StoredFile> findFilesMissingHash(
        int limit, const std::optional<FileCursor>& after = std::nullopt) override;

    /**
     * @brief Map a stored_file row (selected with the repository's column list)
     */
    static StoredFile mapFile(const Json::Value& row);

    /**
     * @brief Map a file_reference row (selected with the repository's column list)
     */
    static FileReference mapReference(const Json::Value& row);

private:
    std::shared_ptr<common::DbConnectionPool> pool_;
    std::shared_ptr<common::IQueryExecutor> queryExecutor_;
};

} // namespace filestore::infrastructure::repository
