/**
 * @file InMemoryFileStoreRepository.hpp
 * @brief Process-local implementation of the file store repository
 */

#pragma once

#include "../../domain/repository/IFileStoreRepository.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace filestore::infrastructure::repository {

using namespace filestore::domain::repository;
using namespace filestore::domain::model;

/**
 * @brief In-memory file store with the same contract as the PostgreSQL one
 *
 * Transactions are serialised by a writer lock held from begin() until the
 * transaction ends, and stage their changes on a private copy of the tables
 * that is published on commit. Unique and foreign key rules raise the same
 * typed exceptions, with the same constraint names, as the database schema.
 * After a constraint violation the transaction only accepts rollback.
 *
 * Transactions keep a reference to the repository, which must outlive them.
 * A thread must not begin a second transaction while it still holds one.
 */
class InMemoryFileStoreRepository : public IFileStoreRepository {
public:
    struct Tables {
        std::map<std::string, StoredFile> files;          // by id
        std::map<std::string, FileReference> references;  // by id
    };

    InMemoryFileStoreRepository() = default;

    InMemoryFileStoreRepository(const InMemoryFileStoreRepository&) = delete;
    InMemoryFileStoreRepository& operator=(const InMemoryFileStoreRepository&) = delete;

    std::unique_ptr<IFileStoreTransaction> begin() override;

    std::optional<StoredFile> findFileById(const FileId& id) override;

    Page<StoredFile> findFiles(const FileQuery& query) override;

    std::vector<FileReference> findReferences(const std::optional<FileId>& originalFileId) override;

    StorageStatistics getStatistics() override;

    std::vector<StoredFile> findFilesMissingHash(
        int limit, const std::optional<FileCursor>& after = std::nullopt) override;

    /**
     * @brief Insert a pre-hashing record directly (content_hash null)
     *
     * Seeds legacy rows for the backfill path; new files always go through
     * a transaction.
     */
    void importLegacyFile(const StoredFile& file);

private:
    friend class InMemoryFileStoreTransaction;

    Tables snapshot() const;

    void publish(Tables tables);

    std::mutex writerMutex_;
    mutable std::shared_mutex stateMutex_;
    Tables committed_;
};

} // namespace filestore::infrastructure::repository
