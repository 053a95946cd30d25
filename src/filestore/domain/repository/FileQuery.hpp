/**
 * @file FileQuery.hpp
 * @brief Filter, ordering and pagination criteria for file listings
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace filestore::domain::repository {

/**
 * @brief Pagination parameters
 */
struct PageRequest {
    int page = 0;
    int size = 20;

    [[nodiscard]] int64_t getOffset() const noexcept {
        return static_cast<int64_t>(page) * size;
    }
};

/**
 * @brief Paginated result
 */
template<typename T>
struct Page {
    std::vector<T> content;
    int page = 0;
    int size = 0;
    int64_t totalElements = 0;
    int totalPages = 0;

    [[nodiscard]] bool hasNext() const noexcept {
        return page < totalPages - 1;
    }

    [[nodiscard]] bool hasPrevious() const noexcept {
        return page > 0;
    }
};

enum class FileSortField {
    ORIGINAL_FILENAME,
    SIZE,
    UPLOADED_AT
};

inline std::string toString(FileSortField field) {
    switch (field) {
        case FileSortField::ORIGINAL_FILENAME: return "original_filename";
        case FileSortField::SIZE: return "size";
        case FileSortField::UPLOADED_AT: return "uploaded_at";
    }
    return "uploaded_at";
}

/**
 * @brief File listing criteria
 *
 * Text filters are case-insensitive. uploadedFrom is inclusive and
 * uploadedUntil exclusive.
 */
struct FileQuery {
    std::optional<std::string> filename;   // substring of original filename
    std::optional<std::string> fileType;   // exact file type
    std::optional<std::string> search;     // substring of filename or file type
    std::optional<int64_t> minSize;
    std::optional<int64_t> maxSize;
    std::optional<std::chrono::system_clock::time_point> uploadedFrom;
    std::optional<std::chrono::system_clock::time_point> uploadedUntil;

    FileSortField sortField = FileSortField::UPLOADED_AT;
    bool descending = true;

    PageRequest pageRequest;
};

/**
 * @brief Keyset position in the (uploaded_at, id) order of stored files
 */
struct FileCursor {
    std::chrono::system_clock::time_point uploadedAt;
    std::string id;
};

/**
 * @brief Store-wide deduplication totals
 */
struct StorageStatistics {
    int64_t totalFiles = 0;
    int64_t totalReferences = 0;
    int64_t physicalBytes = 0;   // sum of stored file sizes
    int64_t storageSaved = 0;    // sum of storage_saved

    /**
     * @brief Bytes the uploads would occupy without deduplication
     */
    [[nodiscard]] int64_t logicalBytes() const noexcept {
        return physicalBytes + storageSaved;
    }

    [[nodiscard]] double savingsPercent() const noexcept {
        int64_t logical = logicalBytes();
        if (logical == 0) return 0.0;
        return static_cast<double>(storageSaved) / static_cast<double>(logical) * 100.0;
    }
};

} // namespace filestore::domain::repository
