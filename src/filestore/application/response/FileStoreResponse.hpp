/**
 * @file FileStoreResponse.hpp
 * @brief Response DTOs for file store operations
 */

#pragma once

#include "../../domain/model/StoredFile.hpp"
#include "../../domain/model/FileReference.hpp"
#include "../../domain/repository/FileQuery.hpp"
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace filestore::application::response {

using namespace filestore::domain::model;

/**
 * @brief ISO-8601 UTC rendering, e.g. 2024-03-01T12:30:00Z
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

/**
 * @brief Stored file details
 */
struct StoredFileResponse {
    std::string id;
    std::string originalFilename;
    std::string fileType;
    int64_t size = 0;
    std::string sizeFormatted;
    std::string uploadedAt;
    std::optional<std::string> contentHash;
    std::string blobKey;
    int referenceCount = 1;
    int64_t storageSaved = 0;
    std::string storageSavedFormatted;

    static StoredFileResponse fromDomain(const StoredFile& file) {
        StoredFileResponse response;
        response.id = file.getId().toString();
        response.originalFilename = file.getOriginalFilename().toString();
        response.fileType = file.getFileType();
        response.size = file.getSize().toBytes();
        response.sizeFormatted = file.getSize().toHumanReadable();
        response.uploadedAt = formatTimestamp(file.getUploadedAt());
        if (file.getContentHash()) {
            response.contentHash = file.getContentHash()->toString();
        }
        response.blobKey = file.getBlobKey();
        response.referenceCount = file.getReferenceCount();
        response.storageSaved = file.getStorageSaved();
        response.storageSavedFormatted = FileSize::ofBytes(file.getStorageSaved()).toHumanReadable();
        return response;
    }

    [[nodiscard]] nlohmann::json toJson() const {
        return {
            {"id", id},
            {"originalFilename", originalFilename},
            {"fileType", fileType},
            {"size", size},
            {"sizeFormatted", sizeFormatted},
            {"uploadedAt", uploadedAt},
            {"contentHash", contentHash ? nlohmann::json(*contentHash) : nlohmann::json(nullptr)},
            {"blobKey", blobKey},
            {"referenceCount", referenceCount},
            {"storageSaved", storageSaved},
            {"storageSavedFormatted", storageSavedFormatted}
        };
    }
};

/**
 * @brief File reference details
 */
struct FileReferenceResponse {
    std::string id;
    std::string originalFileId;
    std::string referenceName;
    std::string createdAt;

    static FileReferenceResponse fromDomain(const FileReference& reference) {
        FileReferenceResponse response;
        response.id = reference.getId().toString();
        response.originalFileId = reference.getOriginalFileId().toString();
        response.referenceName = reference.getReferenceName().toString();
        response.createdAt = formatTimestamp(reference.getCreatedAt());
        return response;
    }

    [[nodiscard]] nlohmann::json toJson() const {
        return {
            {"id", id},
            {"originalFileId", originalFileId},
            {"referenceName", referenceName},
            {"createdAt", createdAt}
        };
    }
};

enum class SubmitOutcome {
    ORIGINAL,    // new content stored
    REFERENCE    // content already present, reference created
};

inline std::string toString(SubmitOutcome outcome) {
    return outcome == SubmitOutcome::ORIGINAL ? "original" : "reference";
}

/**
 * @brief Result of a submission
 *
 * file always describes the stored file holding the content, with its
 * counters as committed by this submission.
 */
struct SubmitResponse {
    SubmitOutcome type = SubmitOutcome::ORIGINAL;
    StoredFileResponse file;
    std::optional<FileReferenceResponse> reference;
    std::string message;

    [[nodiscard]] nlohmann::json toJson() const {
        nlohmann::json json = {
            {"type", toString(type)},
            {"message", message},
            {"file", file.toJson()}
        };
        if (reference) {
            json["reference"] = reference->toJson();
        }
        return json;
    }
};

/**
 * @brief Result of deleting a reference: the owner's updated counters
 */
struct DeleteReferenceResponse {
    std::string referenceId;
    StoredFileResponse file;

    [[nodiscard]] nlohmann::json toJson() const {
        return {
            {"referenceId", referenceId},
            {"file", file.toJson()}
        };
    }
};

/**
 * @brief Paginated file listing
 */
struct FileListResponse {
    std::vector<StoredFileResponse> content;
    int page = 0;
    int size = 0;
    int64_t totalElements = 0;
    int totalPages = 0;
    bool hasNext = false;
    bool hasPrevious = false;

    static FileListResponse fromDomain(const domain::repository::Page<StoredFile>& result) {
        FileListResponse response;
        response.page = result.page;
        response.size = result.size;
        response.totalElements = result.totalElements;
        response.totalPages = result.totalPages;
        response.hasNext = result.hasNext();
        response.hasPrevious = result.hasPrevious();
        for (const auto& file : result.content) {
            response.content.push_back(StoredFileResponse::fromDomain(file));
        }
        return response;
    }

    [[nodiscard]] nlohmann::json toJson() const {
        nlohmann::json contentArray = nlohmann::json::array();
        for (const auto& item : content) {
            contentArray.push_back(item.toJson());
        }

        return {
            {"content", contentArray},
            {"page", page},
            {"size", size},
            {"totalElements", totalElements},
            {"totalPages", totalPages},
            {"hasNext", hasNext},
            {"hasPrevious", hasPrevious}
        };
    }
};

struct ReferenceListResponse {
    std::vector<FileReferenceResponse> content;

    [[nodiscard]] nlohmann::json toJson() const {
        nlohmann::json contentArray = nlohmann::json::array();
        for (const auto& item : content) {
            contentArray.push_back(item.toJson());
        }
        return {
            {"content", contentArray},
            {"count", content.size()}
        };
    }
};

/**
 * @brief Store-wide deduplication statistics
 */
struct StorageStatisticsResponse {
    int64_t totalFiles = 0;
    int64_t totalReferences = 0;
    int64_t physicalBytes = 0;
    int64_t logicalBytes = 0;
    int64_t storageSaved = 0;
    std::string storageSavedFormatted;
    double savingsPercent = 0.0;

    static StorageStatisticsResponse fromDomain(const domain::repository::StorageStatistics& stats) {
        StorageStatisticsResponse response;
        response.totalFiles = stats.totalFiles;
        response.totalReferences = stats.totalReferences;
        response.physicalBytes = stats.physicalBytes;
        response.logicalBytes = stats.logicalBytes();
        response.storageSaved = stats.storageSaved;
        response.storageSavedFormatted = FileSize::ofBytes(stats.storageSaved).toHumanReadable();
        response.savingsPercent = stats.savingsPercent();
        return response;
    }

    [[nodiscard]] nlohmann::json toJson() const {
        return {
            {"totalFiles", totalFiles},
            {"totalReferences", totalReferences},
            {"physicalBytes", physicalBytes},
            {"logicalBytes", logicalBytes},
            {"storageSaved", storageSaved},
            {"storageSavedFormatted", storageSavedFormatted},
            {"savingsPercent", savingsPercent}
        };
    }
};

/**
 * @brief Outcome of one legacy hash backfill run
 */
struct BackfillReport {
    int scanned = 0;
    int updated = 0;
    int duplicates = 0;   // content already held by another file
    int failed = 0;       // blob missing or unreadable
    std::vector<std::string> duplicateFileIds;
    std::vector<std::string> failedFileIds;

    [[nodiscard]] nlohmann::json toJson() const {
        return {
            {"scanned", scanned},
            {"updated", updated},
            {"duplicates", duplicates},
            {"failed", failed},
            {"duplicateFileIds", duplicateFileIds},
            {"failedFileIds", failedFileIds}
        };
    }
};

} // namespace filestore::application::response
