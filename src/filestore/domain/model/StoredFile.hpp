/**
 * @file StoredFile.hpp
 * @brief Entity for one unique content blob
 */

#pragma once

#include "shared/domain/Entity.hpp"
#include "FileId.hpp"
#include "FileName.hpp"
#include "FileSize.hpp"
#include "ContentHash.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace filestore::domain::model {

/**
 * @brief Stored File Entity
 *
 * One row per distinct content digest. referenceCount counts the original
 * upload plus every FileReference pointing here, so it is never below 1.
 * storageSaved is derived from (size, referenceCount) and is never set on
 * its own.
 */
class StoredFile : public shared::domain::Entity<FileId> {
private:
    std::string blobKey_;
    FileName originalFilename_;
    std::string fileType_;
    FileSize size_;
    std::optional<ContentHash> contentHash_;
    int referenceCount_;
    int64_t storageSaved_;

    StoredFile(
        FileId id,
        std::chrono::system_clock::time_point uploadedAt,
        std::string blobKey,
        FileName originalFilename,
        std::string fileType,
        FileSize size,
        std::optional<ContentHash> contentHash,
        int referenceCount
    )
        : Entity<FileId>(std::move(id), uploadedAt),
          blobKey_(std::move(blobKey)),
          originalFilename_(std::move(originalFilename)),
          fileType_(std::move(fileType)),
          size_(std::move(size)),
          contentHash_(std::move(contentHash)),
          referenceCount_(referenceCount),
          storageSaved_(computeStorageSaved(size_.toBytes(), referenceCount)) {}

public:
    /**
     * @brief Bytes not re-stored thanks to deduplication
     * @return size * (referenceCount - 1) when referenceCount > 1, else 0
     */
    static int64_t computeStorageSaved(int64_t size, int referenceCount) noexcept {
        return referenceCount > 1 ? size * static_cast<int64_t>(referenceCount - 1) : 0;
    }

    /**
     * @brief Reference count after applying delta, floored at 1
     */
    static int nextReferenceCount(int current, int delta) noexcept {
        int next = current + delta;
        return next < 1 ? 1 : next;
    }

    /**
     * @brief Create a new file for freshly stored content
     *
     * referenceCount starts at 1 and storageSaved at 0.
     */
    static StoredFile create(
        FileName originalFilename,
        std::string fileType,
        FileSize size,
        ContentHash contentHash,
        std::string blobKey
    ) {
        // Microsecond precision so the value survives a TIMESTAMPTZ round trip
        auto now = std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now());

        return StoredFile(
            FileId::generate(),
            now,
            std::move(blobKey),
            std::move(originalFilename),
            std::move(fileType),
            std::move(size),
            std::move(contentHash),
            1
        );
    }

    /**
     * @brief Reconstruct from persistence
     *
     * @throws shared::exception::DomainException if referenceCount < 1
     */
    static StoredFile reconstruct(
        FileId id,
        std::chrono::system_clock::time_point uploadedAt,
        std::string blobKey,
        FileName originalFilename,
        std::string fileType,
        FileSize size,
        std::optional<ContentHash> contentHash,
        int referenceCount
    ) {
        if (referenceCount < 1) {
            throw shared::exception::DomainException(
                "INVALID_REFERENCE_COUNT",
                "Reference count must be at least 1, got " + std::to_string(referenceCount)
            );
        }

        return StoredFile(
            std::move(id),
            uploadedAt,
            std::move(blobKey),
            std::move(originalFilename),
            std::move(fileType),
            std::move(size),
            std::move(contentHash),
            referenceCount
        );
    }

    // Getters
    [[nodiscard]] const std::string& getBlobKey() const noexcept { return blobKey_; }
    [[nodiscard]] const FileName& getOriginalFilename() const noexcept { return originalFilename_; }
    [[nodiscard]] const std::string& getFileType() const noexcept { return fileType_; }
    [[nodiscard]] const FileSize& getSize() const noexcept { return size_; }
    [[nodiscard]] std::chrono::system_clock::time_point getUploadedAt() const noexcept { return createdAt_; }
    [[nodiscard]] const std::optional<ContentHash>& getContentHash() const noexcept { return contentHash_; }
    [[nodiscard]] int getReferenceCount() const noexcept { return referenceCount_; }
    [[nodiscard]] int64_t getStorageSaved() const noexcept { return storageSaved_; }

    /**
     * @brief Number of FileReference rows implied by the count
     */
    [[nodiscard]] int getOutstandingReferences() const noexcept {
        return referenceCount_ - 1;
    }

    [[nodiscard]] bool hasReferences() const noexcept {
        return referenceCount_ > 1;
    }

    // Domain methods

    /**
     * @brief Apply a reference count change and recompute storageSaved with it
     */
    void applyReferenceDelta(int delta) noexcept {
        referenceCount_ = nextReferenceCount(referenceCount_, delta);
        storageSaved_ = computeStorageSaved(size_.toBytes(), referenceCount_);
    }

    /**
     * @brief Attach the digest of a legacy record
     *
     * @throws shared::exception::DomainException if a hash is already set
     */
    void assignContentHash(ContentHash hash) {
        if (contentHash_) {
            throw shared::exception::DomainException(
                "CONTENT_HASH_IMMUTABLE",
                "Content hash is already set for file " + id_.toString()
            );
        }
        contentHash_ = std::move(hash);
    }
};

} // namespace filestore::domain::model
