/**
 * @file InMemoryFileStoreRepository.cpp
 * @brief Process-local implementation of the file store repository
 */

#include "InMemoryFileStoreRepository.hpp"
#include "shared/lib/exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace filestore::infrastructure::repository {

namespace {

std::string toLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

bool matches(const StoredFile& file, const FileQuery& query) {
    const auto name = file.getOriginalFilename().toString();
    if (query.filename && !containsIgnoreCase(name, *query.filename)) return false;
    if (query.fileType && toLower(file.getFileType()) != toLower(*query.fileType)) return false;
    if (query.search && !containsIgnoreCase(name, *query.search) &&
        !containsIgnoreCase(file.getFileType(), *query.search)) return false;

    const auto size = file.getSize().toBytes();
    if (query.minSize && size < *query.minSize) return false;
    if (query.maxSize && size > *query.maxSize) return false;

    const auto uploadedAt = file.getUploadedAt();
    if (query.uploadedFrom && uploadedAt < *query.uploadedFrom) return false;
    if (query.uploadedUntil && uploadedAt >= *query.uploadedUntil) return false;
    return true;
}

/**
 * @brief Strict ordering on the sort field, ties broken by id
 */
bool before(const StoredFile& a, const StoredFile& b, FileSortField field, bool descending) {
    int cmp = 0;
    switch (field) {
        case FileSortField::ORIGINAL_FILENAME:
            cmp = a.getOriginalFilename().toString().compare(b.getOriginalFilename().toString());
            break;
        case FileSortField::SIZE:
            cmp = (a.getSize().toBytes() < b.getSize().toBytes()) ? -1
                : (a.getSize().toBytes() > b.getSize().toBytes()) ? 1 : 0;
            break;
        case FileSortField::UPLOADED_AT:
            cmp = (a.getUploadedAt() < b.getUploadedAt()) ? -1
                : (a.getUploadedAt() > b.getUploadedAt()) ? 1 : 0;
            break;
    }
    if (cmp != 0) {
        return descending ? cmp > 0 : cmp < 0;
    }
    return a.getId().toString() < b.getId().toString();
}

} // namespace

// =============================================================================
// Transaction
// =============================================================================

class InMemoryFileStoreTransaction : public IFileStoreTransaction {
public:
    explicit InMemoryFileStoreTransaction(InMemoryFileStoreRepository& store)
        : store_(store),
          writerLock_(store.writerMutex_),
          working_(store.snapshot()) {}

    ~InMemoryFileStoreTransaction() override {
        if (active_) {
            rollback();
        }
    }

    std::optional<StoredFile> findFileByHash(const ContentHash& hash) override {
        ensureUsable();
        for (const auto& [id, file] : working_.files) {
            if (file.getContentHash() && *file.getContentHash() == hash) {
                return file;
            }
        }
        return std::nullopt;
    }

    std::optional<StoredFile> findFileById(const FileId& id) override {
        ensureUsable();
        auto it = working_.files.find(id.toString());
        if (it == working_.files.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<StoredFile> lockFileById(const FileId& id) override {
        // The writer lock already excludes every other transaction
        return findFileById(id);
    }

    void insertFile(const StoredFile& file) override {
        ensureUsable();
        const auto key = file.getId().toString();
        if (working_.files.count(key) > 0) {
            fail<common::UniqueViolationException>(
                "duplicate key value violates unique constraint \"stored_file_pkey\"",
                "stored_file_pkey");
        }
        if (file.getContentHash() && findFileByHash(*file.getContentHash())) {
            fail<common::UniqueViolationException>(
                std::string("duplicate key value violates unique constraint \"") +
                    constraint::CONTENT_HASH_UNIQUE + "\"",
                constraint::CONTENT_HASH_UNIQUE);
        }
        working_.files.emplace(key, file);
    }

    void insertReference(const FileReference& reference) override {
        ensureUsable();
        if (working_.files.count(reference.getOriginalFileId().toString()) == 0) {
            fail<common::ForeignKeyViolationException>(
                std::string("insert on table \"file_reference\" violates foreign key constraint \"") +
                    constraint::REFERENCE_FILE_FK + "\"",
                constraint::REFERENCE_FILE_FK);
        }
        if (findReferenceByName(reference.getReferenceName())) {
            fail<common::UniqueViolationException>(
                std::string("duplicate key value violates unique constraint \"") +
                    constraint::REFERENCE_NAME_UNIQUE + "\"",
                constraint::REFERENCE_NAME_UNIQUE);
        }
        working_.references.emplace(reference.getId().toString(), reference);
    }

    std::optional<FileReference> lockReferenceById(const ReferenceId& id) override {
        ensureUsable();
        auto it = working_.references.find(id.toString());
        if (it == working_.references.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<FileReference> findReferenceByName(const FileName& name) override {
        ensureUsable();
        for (const auto& [id, reference] : working_.references) {
            if (reference.getReferenceName() == name) {
                return reference;
            }
        }
        return std::nullopt;
    }

    int64_t countReferences(const FileId& id) override {
        ensureUsable();
        return std::count_if(working_.references.begin(), working_.references.end(),
                             [&id](const auto& entry) {
                                 return entry.second.getOriginalFileId() == id;
                             });
    }

    std::optional<StoredFile> adjustReferenceCount(const FileId& id, int delta) override {
        ensureUsable();
        auto it = working_.files.find(id.toString());
        if (it == working_.files.end()) {
            return std::nullopt;
        }
        it->second.applyReferenceDelta(delta);
        return it->second;
    }

    bool deleteFile(const FileId& id) override {
        ensureUsable();
        if (countReferences(id) > 0) {
            fail<common::ForeignKeyViolationException>(
                std::string("update or delete on table \"stored_file\" violates foreign key constraint \"") +
                    constraint::REFERENCE_FILE_FK + "\"",
                constraint::REFERENCE_FILE_FK);
        }
        return working_.files.erase(id.toString()) > 0;
    }

    bool deleteReference(const ReferenceId& id) override {
        ensureUsable();
        return working_.references.erase(id.toString()) > 0;
    }

    bool setContentHash(const FileId& id, const ContentHash& hash) override {
        ensureUsable();
        auto it = working_.files.find(id.toString());
        if (it == working_.files.end() || it->second.getContentHash()) {
            return false;
        }
        if (findFileByHash(hash)) {
            fail<common::UniqueViolationException>(
                std::string("duplicate key value violates unique constraint \"") +
                    constraint::CONTENT_HASH_UNIQUE + "\"",
                constraint::CONTENT_HASH_UNIQUE);
        }
        it->second.assignContentHash(hash);
        return true;
    }

    void commit() override {
        ensureUsable();
        store_.publish(std::move(working_));
        active_ = false;
        writerLock_.unlock();
    }

    void rollback() override {
        if (!active_) {
            return;
        }
        active_ = false;
        working_ = {};
        writerLock_.unlock();
    }

private:
    void ensureUsable() const {
        if (!active_) {
            throw common::DatabaseException("transaction is no longer active");
        }
        if (aborted_) {
            throw common::DatabaseException(
                "current transaction is aborted, commands ignored until end of transaction block", "25P02");
        }
    }

    template<typename Violation>
    [[noreturn]] void fail(const std::string& message, const std::string& constraintName) {
        aborted_ = true;
        throw Violation(message, constraintName);
    }

    InMemoryFileStoreRepository& store_;
    std::unique_lock<std::mutex> writerLock_;
    InMemoryFileStoreRepository::Tables working_;
    bool active_ = true;
    bool aborted_ = false;
};

// =============================================================================
// Repository
// =============================================================================

std::unique_ptr<IFileStoreTransaction> InMemoryFileStoreRepository::begin() {
    return std::make_unique<InMemoryFileStoreTransaction>(*this);
}

InMemoryFileStoreRepository::Tables InMemoryFileStoreRepository::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return committed_;
}

void InMemoryFileStoreRepository::publish(Tables tables) {
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    committed_ = std::move(tables);
}

std::optional<StoredFile> InMemoryFileStoreRepository::findFileById(const FileId& id) {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    auto it = committed_.files.find(id.toString());
    if (it == committed_.files.end()) {
        return std::nullopt;
    }
    return it->second;
}

Page<StoredFile> InMemoryFileStoreRepository::findFiles(const FileQuery& query) {
    std::vector<StoredFile> matched;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        for (const auto& [id, file] : committed_.files) {
            if (matches(file, query)) {
                matched.push_back(file);
            }
        }
    }

    std::sort(matched.begin(), matched.end(), [&query](const StoredFile& a, const StoredFile& b) {
        return before(a, b, query.sortField, query.descending);
    });

    const auto& pageRequest = query.pageRequest;
    Page<StoredFile> page;
    page.page = pageRequest.page;
    page.size = pageRequest.size;
    page.totalElements = static_cast<int64_t>(matched.size());
    page.totalPages = pageRequest.size > 0
        ? static_cast<int>((page.totalElements + pageRequest.size - 1) / pageRequest.size)
        : 0;

    size_t offset = static_cast<size_t>(std::max<int64_t>(0, pageRequest.getOffset()));
    for (size_t i = offset; i < matched.size() && page.content.size() < static_cast<size_t>(pageRequest.size); ++i) {
        page.content.push_back(matched[i]);
    }

    spdlog::debug("[InMemoryFileStoreRepository] findFiles: {} matched, {} returned",
                  page.totalElements, page.content.size());
    return page;
}

std::vector<FileReference> InMemoryFileStoreRepository::findReferences(const std::optional<FileId>& originalFileId) {
    std::vector<FileReference> result;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        for (const auto& [id, reference] : committed_.references) {
            if (!originalFileId || reference.getOriginalFileId() == *originalFileId) {
                result.push_back(reference);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const FileReference& a, const FileReference& b) {
        if (a.getCreatedAt() != b.getCreatedAt()) {
            return a.getCreatedAt() > b.getCreatedAt();
        }
        return a.getId().toString() < b.getId().toString();
    });
    return result;
}

StorageStatistics InMemoryFileStoreRepository::getStatistics() {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);

    StorageStatistics stats;
    stats.totalFiles = static_cast<int64_t>(committed_.files.size());
    stats.totalReferences = static_cast<int64_t>(committed_.references.size());
    for (const auto& [id, file] : committed_.files) {
        stats.physicalBytes += file.getSize().toBytes();
        stats.storageSaved += file.getStorageSaved();
    }
    return stats;
}

std::vector<StoredFile> InMemoryFileStoreRepository::findFilesMissingHash(
    int limit, const std::optional<FileCursor>& after) {
    auto pastCursor = [&after](const StoredFile& file) {
        if (!after) return true;
        if (file.getUploadedAt() != after->uploadedAt) return file.getUploadedAt() > after->uploadedAt;
        return file.getId().toString() > after->id;
    };

    std::vector<StoredFile> result;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        for (const auto& [id, file] : committed_.files) {
            if (!file.getContentHash() && pastCursor(file)) {
                result.push_back(file);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const StoredFile& a, const StoredFile& b) {
        return before(a, b, FileSortField::UPLOADED_AT, false);
    });
    if (limit >= 0 && result.size() > static_cast<size_t>(limit)) {
        result.erase(result.begin() + limit, result.end());
    }
    return result;
}

void InMemoryFileStoreRepository::importLegacyFile(const StoredFile& file) {
    std::lock_guard<std::mutex> writer(writerMutex_);
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    committed_.files.insert_or_assign(file.getId().toString(), file);
}

} // namespace filestore::infrastructure::repository
