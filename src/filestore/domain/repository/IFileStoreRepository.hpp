/**
 * @file IFileStoreRepository.hpp
 * @brief Repository interfaces for stored files and their references
 */

#pragma once

#include "FileQuery.hpp"
#include "../model/StoredFile.hpp"
#include "../model/FileReference.hpp"
#include "../model/FileId.hpp"
#include "../model/ReferenceId.hpp"
#include "../model/ContentHash.hpp"
#include "../model/FileName.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace filestore::domain::repository {

using namespace filestore::domain::model;

/**
 * @brief Names of the integrity constraints both backends enforce
 *
 * Reported through common::ConstraintViolationException::getConstraint().
 */
namespace constraint {
    constexpr const char* CONTENT_HASH_UNIQUE = "uq_stored_file_content_hash";
    constexpr const char* REFERENCE_NAME_UNIQUE = "uq_file_reference_name";
    constexpr const char* REFERENCE_FILE_FK = "fk_file_reference_original_file";
} // namespace constraint

/**
 * @brief One atomic unit of work over the file and reference tables
 *
 * Nothing is visible to other transactions until commit(). Destroying an
 * uncommitted transaction rolls it back.
 *
 * Mutating methods throw common::UniqueViolationException or
 * common::ForeignKeyViolationException (carrying the constraint name) when an
 * integrity rule is hit, and common::DatabaseException for other failures.
 * After such an exception the transaction can only be rolled back.
 */
class IFileStoreTransaction {
public:
    virtual ~IFileStoreTransaction() = default;

    virtual std::optional<StoredFile> findFileByHash(const ContentHash& hash) = 0;

    virtual std::optional<StoredFile> findFileById(const FileId& id) = 0;

    /**
     * @brief Read a file row and hold an exclusive lock on it until the transaction ends
     */
    virtual std::optional<StoredFile> lockFileById(const FileId& id) = 0;

    virtual void insertFile(const StoredFile& file) = 0;

    virtual void insertReference(const FileReference& reference) = 0;

    /**
     * @brief Read a reference row and hold an exclusive lock on it
     */
    virtual std::optional<FileReference> lockReferenceById(const ReferenceId& id) = 0;

    virtual std::optional<FileReference> findReferenceByName(const FileName& name) = 0;

    /**
     * @brief Number of live FileReference rows pointing at the file
     */
    virtual int64_t countReferences(const FileId& id) = 0;

    /**
     * @brief Add delta to reference_count (floored at 1) and recompute storage_saved
     *
     * A single read-modify-write at the storage layer.
     *
     * @return The updated file, or nullopt if the row does not exist
     */
    virtual std::optional<StoredFile> adjustReferenceCount(const FileId& id, int delta) = 0;

    /**
     * @return true if a row was deleted
     */
    virtual bool deleteFile(const FileId& id) = 0;

    /**
     * @return true if a row was deleted
     */
    virtual bool deleteReference(const ReferenceId& id) = 0;

    /**
     * @brief Set the digest of a file whose content_hash is still null
     * @return true if the row was updated
     */
    virtual bool setContentHash(const FileId& id, const ContentHash& hash) = 0;

    virtual void commit() = 0;

    virtual void rollback() = 0;
};

/**
 * @brief Repository for stored files and the reference ledger
 */
class IFileStoreRepository {
public:
    virtual ~IFileStoreRepository() = default;

    /**
     * @brief Start a unit of work
     */
    virtual std::unique_ptr<IFileStoreTransaction> begin() = 0;

    virtual std::optional<StoredFile> findFileById(const FileId& id) = 0;

    /**
     * @brief Filtered, ordered page of files
     */
    virtual Page<StoredFile> findFiles(const FileQuery& query) = 0;

    /**
     * @brief References newest first, optionally only those of one file
     */
    virtual std::vector<FileReference> findReferences(const std::optional<FileId>& originalFileId) = 0;

    virtual StorageStatistics getStatistics() = 0;

    /**
     * @brief Legacy files whose content_hash is null, oldest first
     * @param after only files strictly after this position in (uploaded_at, id) order
     */
    virtual std::vector<StoredFile> findFilesMissingHash(
        int limit, const std::optional<FileCursor>& after = std::nullopt) = 0;
};

} // namespace filestore::domain::repository
