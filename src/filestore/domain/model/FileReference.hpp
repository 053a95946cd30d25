/**
 * @file FileReference.hpp
 * @brief Entity for a named pointer to an existing stored file
 */

#pragma once

#include "shared/domain/Entity.hpp"
#include "ReferenceId.hpp"
#include "FileId.hpp"
#include "FileName.hpp"
#include <chrono>

namespace filestore::domain::model {

/**
 * @brief File Reference Entity
 *
 * Reference names are unique across all references.
 */
class FileReference : public shared::domain::Entity<ReferenceId> {
private:
    FileId originalFileId_;
    FileName referenceName_;

    FileReference(
        ReferenceId id,
        std::chrono::system_clock::time_point createdAt,
        FileId originalFileId,
        FileName referenceName
    )
        : Entity<ReferenceId>(std::move(id), createdAt),
          originalFileId_(std::move(originalFileId)),
          referenceName_(std::move(referenceName)) {}

public:
    static FileReference create(FileId originalFileId, FileName referenceName) {
        auto now = std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now());
        return FileReference(
            ReferenceId::generate(),
            now,
            std::move(originalFileId),
            std::move(referenceName)
        );
    }

    static FileReference reconstruct(
        ReferenceId id,
        std::chrono::system_clock::time_point createdAt,
        FileId originalFileId,
        FileName referenceName
    ) {
        return FileReference(
            std::move(id),
            createdAt,
            std::move(originalFileId),
            std::move(referenceName)
        );
    }

    [[nodiscard]] const FileId& getOriginalFileId() const noexcept { return originalFileId_; }
    [[nodiscard]] const FileName& getReferenceName() const noexcept { return referenceName_; }
};

} // namespace filestore::domain::model
