/**
 * @file ListFilesUseCase.hpp
 * @brief Read-side use cases: file listing, reference listing, statistics
 */

#pragma once

#include "../command/FileStoreCommands.hpp"
#include "../response/FileStoreResponse.hpp"
#include "../exception/FileStoreException.hpp"
#include "../../domain/repository/IFileStoreRepository.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>

namespace filestore::application::usecase {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using namespace filestore::application::command;
using namespace filestore::application::response;
using filestore::application::exception::FileStoreException;
using filestore::application::exception::rethrowAsFileStoreException;

/**
 * @brief Use case for listing files with filters, ordering and pagination
 *
 * Every call reads the store; nothing is cached.
 */
class ListFilesUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;

    static std::optional<std::string> nonEmpty(const std::optional<std::string>& value) {
        if (value && !value->empty()) {
            return value;
        }
        return std::nullopt;
    }

    /**
     * @brief Parse YYYY-MM-DD as midnight UTC
     */
    static std::chrono::sys_days parseDate(const std::string& text, const char* field) {
        int y = 0;
        unsigned m = 0;
        unsigned d = 0;
        char tail = '\0';
        if (text.length() != 10 ||
            std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
            throw FileStoreException::validation(
                std::string(field) + " must be a date in YYYY-MM-DD format");
        }

        std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
        if (!ymd.ok()) {
            throw FileStoreException::validation(std::string(field) + " is not a valid date: " + text);
        }
        return std::chrono::sys_days{ymd};
    }

    static void applyOrdering(const std::string& ordering, FileQuery& query) {
        std::string field = ordering;
        query.descending = false;
        if (!field.empty() && field[0] == '-') {
            query.descending = true;
            field = field.substr(1);
        }

        if (field == "original_filename") {
            query.sortField = FileSortField::ORIGINAL_FILENAME;
        } else if (field == "size") {
            query.sortField = FileSortField::SIZE;
        } else if (field == "uploaded_at") {
            query.sortField = FileSortField::UPLOADED_AT;
        } else {
            throw FileStoreException::validation(
                "ordering must be one of original_filename, size, uploaded_at (optionally prefixed with '-')");
        }
    }

public:
    static constexpr int MAX_PAGE_SIZE = 100;
    static constexpr int64_t MAX_OFFSET = std::numeric_limits<int32_t>::max();

    explicit ListFilesUseCase(std::shared_ptr<IFileStoreRepository> repository)
        : repository_(std::move(repository)) {
        if (!repository_) {
            throw std::invalid_argument("ListFilesUseCase: repository is required");
        }
    }

    /**
     * @brief Translate a listing command into a validated query
     * @throws FileStoreException (VALIDATION_ERROR)
     */
    static FileQuery toQuery(const ListFilesCommand& command) {
        if (command.size < 1 || command.size > MAX_PAGE_SIZE) {
            throw FileStoreException::validation(
                "size must be between 1 and " + std::to_string(MAX_PAGE_SIZE));
        }
        if (command.page < 0) {
            throw FileStoreException::validation("page cannot be negative");
        }
        if (PageRequest{command.page, command.size}.getOffset() > MAX_OFFSET) {
            throw FileStoreException::validation("page is out of range");
        }
        if ((command.minSize && *command.minSize < 0) || (command.maxSize && *command.maxSize < 0)) {
            throw FileStoreException::validation("size filters cannot be negative");
        }
        if (command.minSize && command.maxSize && *command.minSize > *command.maxSize) {
            throw FileStoreException::validation("min_size cannot exceed max_size");
        }

        FileQuery query;
        query.filename = nonEmpty(command.filename);
        query.fileType = nonEmpty(command.fileType);
        query.search = nonEmpty(command.search);
        query.minSize = command.minSize;
        query.maxSize = command.maxSize;

        if (auto after = nonEmpty(command.uploadedAfter)) {
            query.uploadedFrom = parseDate(*after, "uploaded_after");
        }
        if (auto before = nonEmpty(command.uploadedBefore)) {
            // Inclusive calendar day: everything before the next midnight
            query.uploadedUntil = parseDate(*before, "uploaded_before") + std::chrono::days{1};
        }
        if (query.uploadedFrom && query.uploadedUntil && *query.uploadedFrom >= *query.uploadedUntil) {
            throw FileStoreException::validation("uploaded_after cannot be later than uploaded_before");
        }

        applyOrdering(command.ordering, query);
        query.pageRequest = PageRequest{command.page, command.size};
        return query;
    }

    /**
     * @brief Execute the use case
     */
    FileListResponse execute(const ListFilesCommand& command) {
        try {
            auto query = toQuery(command);
            return FileListResponse::fromDomain(repository_->findFiles(query));
        } catch (const std::exception&) {
            rethrowAsFileStoreException("list files");
        }
    }
};

/**
 * @brief Use case for listing references, optionally of one file
 */
class ListReferencesUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;

public:
    explicit ListReferencesUseCase(std::shared_ptr<IFileStoreRepository> repository)
        : repository_(std::move(repository)) {
        if (!repository_) {
            throw std::invalid_argument("ListReferencesUseCase: repository is required");
        }
    }

    /**
     * @throws FileStoreException NOT_FOUND if fileIdStr names a missing file
     */
    ReferenceListResponse execute(const std::optional<std::string>& fileIdStr = std::nullopt) {
        try {
            std::optional<FileId> fileId;
            if (fileIdStr) {
                fileId = FileId::of(*fileIdStr);
                if (!repository_->findFileById(*fileId)) {
                    throw FileStoreException::notFound("File not found: " + *fileIdStr);
                }
            }

            ReferenceListResponse response;
            for (const auto& reference : repository_->findReferences(fileId)) {
                response.content.push_back(FileReferenceResponse::fromDomain(reference));
            }
            return response;

        } catch (const std::exception&) {
            rethrowAsFileStoreException("list references");
        }
    }
};

/**
 * @brief Use case for deduplication statistics
 */
class GetStorageStatisticsUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;

public:
    explicit GetStorageStatisticsUseCase(std::shared_ptr<IFileStoreRepository> repository)
        : repository_(std::move(repository)) {
        if (!repository_) {
            throw std::invalid_argument("GetStorageStatisticsUseCase: repository is required");
        }
    }

    StorageStatisticsResponse execute() {
        try {
            return StorageStatisticsResponse::fromDomain(repository_->getStatistics());
        } catch (const std::exception&) {
            rethrowAsFileStoreException("compute storage statistics");
        }
    }
};

} // namespace filestore::application::usecase
