/**
 * @file FileStoreCommands.hpp
 * @brief Command DTOs for file store operations
 */

#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace filestore::application::command {

/**
 * @brief Command for submitting file content
 *
 * The stream is borrowed for the duration of the call and must be seekable.
 */
struct SubmitFileCommand {
    std::istream* content = nullptr;
    std::string filename;
    std::string contentType;
    int64_t declaredSize = -1;   // negative when the caller does not know the size

    SubmitFileCommand() = default;

    SubmitFileCommand(
        std::istream& content,
        std::string filename,
        std::string contentType = "",
        int64_t declaredSize = -1
    )
        : content(&content),
          filename(std::move(filename)),
          contentType(std::move(contentType)),
          declaredSize(declaredSize) {}
};

/**
 * @brief Command for listing files
 *
 * Values arrive as text from the outer layer and are validated by the use case.
 */
struct ListFilesCommand {
    std::optional<std::string> filename;
    std::optional<std::string> fileType;
    std::optional<std::string> search;
    std::optional<int64_t> minSize;
    std::optional<int64_t> maxSize;
    std::optional<std::string> uploadedAfter;    // YYYY-MM-DD, inclusive
    std::optional<std::string> uploadedBefore;   // YYYY-MM-DD, inclusive
    std::string ordering = "-uploaded_at";       // field name, '-' prefix for descending
    int page = 0;
    int size = 20;
};

} // namespace filestore::application::command
