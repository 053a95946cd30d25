/**
 * @file PostgresFileStoreRepository.cpp
 * @brief PostgreSQL implementation of the file store repository
 */

#include "PostgresFileStoreRepository.hpp"
#include "shared/lib/database/pg_transaction.h"
#include "shared/lib/database/query_helpers.h"
#include "shared/lib/exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace filestore::infrastructure::repository {

namespace {

const char* const FILE_COLUMNS =
    "id::text AS id, blob_key, original_filename, file_type, size, "
    "(EXTRACT(EPOCH FROM uploaded_at) * 1000000)::BIGINT AS uploaded_at_us, "
    "content_hash, reference_count, storage_saved";

const char* const REFERENCE_COLUMNS =
    "id::text AS id, original_file_id::text AS original_file_id, reference_name, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_at_us";

// Exact microsecond timestamp from a bigint parameter
std::string timestampParam(int placeholder) {
    return "(TIMESTAMPTZ 'epoch' + $" + std::to_string(placeholder) +
           "::bigint * INTERVAL '1 microsecond')";
}

int64_t toEpochMicros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMicros(int64_t micros) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros)));
}

const char* const SCHEMA_STATEMENTS[] = {
    R"(
    CREATE TABLE IF NOT EXISTS stored_file (
        id                UUID PRIMARY KEY,
        blob_key          VARCHAR(512) NOT NULL,
        original_filename VARCHAR(255) NOT NULL,
        file_type         VARCHAR(100) NOT NULL DEFAULT '',
        size              BIGINT NOT NULL,
        uploaded_at       TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        content_hash      VARCHAR(64),
        reference_count   INTEGER NOT NULL DEFAULT 1,
        storage_saved     BIGINT NOT NULL DEFAULT 0,
        CONSTRAINT ck_stored_file_size CHECK (size >= 0),
        CONSTRAINT ck_stored_file_reference_count CHECK (reference_count >= 1),
        CONSTRAINT ck_stored_file_storage_saved CHECK (storage_saved = size * (reference_count - 1))
    ))",
    "CREATE UNIQUE INDEX IF NOT EXISTS uq_stored_file_content_hash "
    "ON stored_file (content_hash) WHERE content_hash IS NOT NULL",
    "CREATE INDEX IF NOT EXISTS idx_stored_file_name_type ON stored_file (original_filename, file_type)",
    "CREATE INDEX IF NOT EXISTS idx_stored_file_size_uploaded ON stored_file (size, uploaded_at)",
    "CREATE INDEX IF NOT EXISTS idx_stored_file_hash_size ON stored_file (content_hash, size)",
    "CREATE INDEX IF NOT EXISTS idx_stored_file_uploaded_at ON stored_file (uploaded_at)",
    R"(
    CREATE TABLE IF NOT EXISTS file_reference (
        id               UUID PRIMARY KEY,
        original_file_id UUID NOT NULL,
        reference_name   VARCHAR(255) NOT NULL,
        created_at       TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        CONSTRAINT uq_file_reference_name UNIQUE (reference_name),
        CONSTRAINT fk_file_reference_original_file FOREIGN KEY (original_file_id)
            REFERENCES stored_file (id) ON DELETE RESTRICT
    ))",
    "CREATE INDEX IF NOT EXISTS idx_file_reference_original_file ON file_reference (original_file_id)",
};

std::optional<StoredFile> firstFile(const Json::Value& rows) {
    if (rows.empty()) {
        return std::nullopt;
    }
    return PostgresFileStoreRepository::mapFile(rows[0]);
}

std::optional<FileReference> firstReference(const Json::Value& rows) {
    if (rows.empty()) {
        return std::nullopt;
    }
    return PostgresFileStoreRepository::mapReference(rows[0]);
}

} // namespace

// =============================================================================
// Transaction
// =============================================================================

class PostgresFileStoreTransaction : public IFileStoreTransaction {
public:
    explicit PostgresFileStoreTransaction(common::DbConnectionPool& pool)
        : tx_(pool) {}

    std::optional<StoredFile> findFileByHash(const ContentHash& hash) override {
        return firstFile(tx_.query(
            std::string("SELECT ") + FILE_COLUMNS + " FROM stored_file WHERE content_hash = $1",
            {hash.toString()}));
    }

    std::optional<StoredFile> findFileById(const FileId& id) override {
        return firstFile(tx_.query(
            std::string("SELECT ") + FILE_COLUMNS + " FROM stored_file WHERE id = $1::uuid",
            {id.toString()}));
    }

    std::optional<StoredFile> lockFileById(const FileId& id) override {
        return firstFile(tx_.query(
            std::string("SELECT ") + FILE_COLUMNS + " FROM stored_file WHERE id = $1::uuid FOR UPDATE",
            {id.toString()}));
    }

    void insertFile(const StoredFile& file) override {
        std::string sql =
            "INSERT INTO stored_file (id, blob_key, original_filename, file_type, size, "
            "uploaded_at, content_hash, reference_count, storage_saved) "
            "VALUES ($1::uuid, $2, $3, COALESCE($4, ''), $5::bigint, " + timestampParam(6) +
            ", $7, $8::int, $9::bigint)";

        tx_.command(sql, {
            file.getId().toString(),
            file.getBlobKey(),
            file.getOriginalFilename().toString(),
            file.getFileType(),
            std::to_string(file.getSize().toBytes()),
            std::to_string(toEpochMicros(file.getUploadedAt())),
            file.getContentHash() ? file.getContentHash()->toString() : "",
            std::to_string(file.getReferenceCount()),
            std::to_string(file.getStorageSaved())
        });
        spdlog::debug("[PostgresFileStoreRepository] Inserted file {}", file.getId().toString());
    }

    void insertReference(const FileReference& reference) override {
        std::string sql =
            "INSERT INTO file_reference (id, original_file_id, reference_name, created_at) "
            "VALUES ($1::uuid, $2::uuid, $3, " + timestampParam(4) + ")";

        tx_.command(sql, {
            reference.getId().toString(),
            reference.getOriginalFileId().toString(),
            reference.getReferenceName().toString(),
            std::to_string(toEpochMicros(reference.getCreatedAt()))
        });
        spdlog::debug("[PostgresFileStoreRepository] Inserted reference {}", reference.getId().toString());
    }

    std::optional<FileReference> lockReferenceById(const ReferenceId& id) override {
        return firstReference(tx_.query(
            std::string("SELECT ") + REFERENCE_COLUMNS + " FROM file_reference WHERE id = $1::uuid FOR UPDATE",
            {id.toString()}));
    }

    std::optional<FileReference> findReferenceByName(const FileName& name) override {
        return firstReference(tx_.query(
            std::string("SELECT ") + REFERENCE_COLUMNS + " FROM file_reference WHERE reference_name = $1",
            {name.toString()}));
    }

    int64_t countReferences(const FileId& id) override {
        auto rows = tx_.query(
            "SELECT COUNT(*) AS count FROM file_reference WHERE original_file_id = $1::uuid",
            {id.toString()});
        return common::db::getInt64(rows[0], "count");
    }

    std::optional<StoredFile> adjustReferenceCount(const FileId& id, int delta) override {
        // One statement: the new count and the derived storage_saved come from the same row version
        std::string sql =
            "UPDATE stored_file SET "
            "reference_count = GREATEST(reference_count + $2::int, 1), "
            "storage_saved = CASE WHEN GREATEST(reference_count + $2::int, 1) > 1 "
            "THEN size * (GREATEST(reference_count + $2::int, 1) - 1) ELSE 0 END "
            "WHERE id = $1::uuid RETURNING " + std::string(FILE_COLUMNS);

        return firstFile(tx_.query(sql, {id.toString(), std::to_string(delta)}));
    }

    bool deleteFile(const FileId& id) override {
        return tx_.command("DELETE FROM stored_file WHERE id = $1::uuid", {id.toString()}) > 0;
    }

    bool deleteReference(const ReferenceId& id) override {
        return tx_.command("DELETE FROM file_reference WHERE id = $1::uuid", {id.toString()}) > 0;
    }

    bool setContentHash(const FileId& id, const ContentHash& hash) override {
        return tx_.command(
            "UPDATE stored_file SET content_hash = $2 WHERE id = $1::uuid AND content_hash IS NULL",
            {id.toString(), hash.toString()}) > 0;
    }

    void commit() override {
        tx_.commit();
    }

    void rollback() override {
        tx_.rollback();
    }

private:
    common::PgTransaction tx_;
};

// =============================================================================
// Repository
// =============================================================================

PostgresFileStoreRepository::PostgresFileStoreRepository(
    std::shared_ptr<common::DbConnectionPool> pool,
    std::shared_ptr<common::IQueryExecutor> queryExecutor
)
    : pool_(std::move(pool)),
      queryExecutor_(std::move(queryExecutor))
{
    if (!pool_ || !queryExecutor_) {
        throw std::invalid_argument("PostgresFileStoreRepository: pool and query executor are required");
    }
}

void PostgresFileStoreRepository::ensureSchema() {
    common::PgTransaction tx(*pool_);
    for (const char* statement : SCHEMA_STATEMENTS) {
        tx.command(statement);
    }
    tx.commit();
    spdlog::info("[PostgresFileStoreRepository] Schema ready");
}

std::unique_ptr<IFileStoreTransaction> PostgresFileStoreRepository::begin() {
    return std::make_unique<PostgresFileStoreTransaction>(*pool_);
}

std::optional<StoredFile> PostgresFileStoreRepository::findFileById(const FileId& id) {
    return firstFile(queryExecutor_->executeQuery(
        std::string("SELECT ") + FILE_COLUMNS + " FROM stored_file WHERE id = $1::uuid",
        {id.toString()}));
}

Page<StoredFile> PostgresFileStoreRepository::findFiles(const FileQuery& query) {
    std::vector<std::string> params;
    std::ostringstream where;
    where << " WHERE 1=1";

    auto next = [&params](std::string value) {
        params.push_back(std::move(value));
        return "$" + std::to_string(params.size());
    };

    if (query.filename) {
        where << " AND " << common::db::ilikeCond("original_filename",
                                                  next("%" + common::db::escapeLike(*query.filename) + "%"));
    }
    if (query.fileType) {
        where << " AND LOWER(file_type) = LOWER(" << next(*query.fileType) << ")";
    }
    if (query.search) {
        std::string placeholder = next("%" + common::db::escapeLike(*query.search) + "%");
        where << " AND (" << common::db::ilikeCond("original_filename", placeholder)
              << " OR " << common::db::ilikeCond("file_type", placeholder) << ")";
    }
    if (query.minSize) {
        where << " AND size >= " << next(std::to_string(*query.minSize)) << "::bigint";
    }
    if (query.maxSize) {
        where << " AND size <= " << next(std::to_string(*query.maxSize)) << "::bigint";
    }
    if (query.uploadedFrom) {
        next(std::to_string(toEpochMicros(*query.uploadedFrom)));
        where << " AND uploaded_at >= " << timestampParam(static_cast<int>(params.size()));
    }
    if (query.uploadedUntil) {
        next(std::to_string(toEpochMicros(*query.uploadedUntil)));
        where << " AND uploaded_at < " << timestampParam(static_cast<int>(params.size()));
    }

    const auto& pageRequest = query.pageRequest;

    auto countValue = queryExecutor_->executeScalar(
        "SELECT COUNT(*) FROM stored_file" + where.str(), params);
    int64_t totalElements = common::db::scalarToInt64(countValue);

    std::ostringstream sql;
    sql << "SELECT " << FILE_COLUMNS << " FROM stored_file" << where.str()
        << " ORDER BY " << toString(query.sortField) << (query.descending ? " DESC" : " ASC")
        << ", id ASC"
        << common::db::paginationClause(pageRequest.size, pageRequest.getOffset());

    auto rows = queryExecutor_->executeQuery(sql.str(), params);

    Page<StoredFile> page;
    page.page = pageRequest.page;
    page.size = pageRequest.size;
    page.totalElements = totalElements;
    page.totalPages = pageRequest.size > 0
        ? static_cast<int>((totalElements + pageRequest.size - 1) / pageRequest.size)
        : 0;

    for (const auto& row : rows) {
        page.content.push_back(mapFile(row));
    }

    spdlog::debug("[PostgresFileStoreRepository] findFiles: {} matched, {} returned",
                  totalElements, page.content.size());
    return page;
}

std::vector<FileReference> PostgresFileStoreRepository::findReferences(const std::optional<FileId>& originalFileId) {
    std::string sql = std::string("SELECT ") + REFERENCE_COLUMNS + " FROM file_reference";
    std::vector<std::string> params;
    if (originalFileId) {
        sql += " WHERE original_file_id = $1::uuid";
        params.push_back(originalFileId->toString());
    }
    sql += " ORDER BY created_at DESC, id ASC";

    std::vector<FileReference> references;
    for (const auto& row : queryExecutor_->executeQuery(sql, params)) {
        references.push_back(mapReference(row));
    }
    return references;
}

StorageStatistics PostgresFileStoreRepository::getStatistics() {
    auto rows = queryExecutor_->executeQuery(
        "SELECT COUNT(*) AS total_files, "
        "COALESCE(SUM(size), 0)::BIGINT AS physical_bytes, "
        "COALESCE(SUM(storage_saved), 0)::BIGINT AS storage_saved, "
        "(SELECT COUNT(*) FROM file_reference) AS total_references "
        "FROM stored_file");

    StorageStatistics stats;
    if (!rows.empty()) {
        const auto& row = rows[0];
        stats.totalFiles = common::db::getInt64(row, "total_files");
        stats.totalReferences = common::db::getInt64(row, "total_references");
        stats.physicalBytes = common::db::getInt64(row, "physical_bytes");
        stats.storageSaved = common::db::getInt64(row, "storage_saved");
    }
    return stats;
}

std::vector<StoredFile> PostgresFileStoreRepository::findFilesMissingHash(
    int limit, const std::optional<FileCursor>& after) {
    std::string sql = std::string("SELECT ") + FILE_COLUMNS +
        " FROM stored_file WHERE content_hash IS NULL";
    std::vector<std::string> params;
    if (after) {
        params = {std::to_string(toEpochMicros(after->uploadedAt)), after->id};
        sql += " AND (uploaded_at, id) > (" + timestampParam(1) + ", $2::uuid)";
    }
    sql += " ORDER BY uploaded_at ASC, id ASC" + common::db::limitClause(limit);

    auto rows = queryExecutor_->executeQuery(sql, params);

    std::vector<StoredFile> files;
    for (const auto& row : rows) {
        files.push_back(mapFile(row));
    }
    return files;
}

StoredFile PostgresFileStoreRepository::mapFile(const Json::Value& row) {
    std::optional<ContentHash> contentHash;
    if (row.isMember("content_hash") && !row["content_hash"].isNull()) {
        contentHash = ContentHash::of(row["content_hash"].asString());
    }

    return StoredFile::reconstruct(
        FileId::of(common::db::getString(row, "id")),
        fromEpochMicros(common::db::getInt64(row, "uploaded_at_us")),
        common::db::getString(row, "blob_key"),
        FileName::of(common::db::getString(row, "original_filename")),
        common::db::getString(row, "file_type"),
        FileSize::ofBytes(common::db::getInt64(row, "size")),
        std::move(contentHash),
        common::db::getInt(row, "reference_count", 1)
    );
}

FileReference PostgresFileStoreRepository::mapReference(const Json::Value& row) {
    return FileReference::reconstruct(
        ReferenceId::of(common::db::getString(row, "id")),
        fromEpochMicros(common::db::getInt64(row, "created_at_us")),
        FileId::of(common::db::getString(row, "original_file_id")),
        FileName::of(common::db::getString(row, "reference_name"))
    );
}

} // namespace filestore::infrastructure::repository
