/**
 * @file ReferenceCountMaintenance.hpp
 * @brief Reference count adjustment, triggered by reference creation and deletion
 */

#pragma once

#include "../exception/FileStoreException.hpp"
#include "../../domain/repository/IFileStoreRepository.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace filestore::application::service {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using filestore::application::exception::FileStoreException;

/**
 * @brief Keeps reference_count and storage_saved consistent
 *
 * Called by the submit use case (+1 after inserting a reference) and the
 * delete-reference use case (-1 after deleting one), inside their
 * transaction. Never exposed to outer layers.
 */
class ReferenceCountMaintenance {
public:
    /**
     * @brief Apply +1 or -1 to a file's reference count
     *
     * The count is floored at 1 and storage_saved recomputed in the same
     * storage-level write.
     *
     * @return The updated file
     * @throws std::invalid_argument if delta is not +1 or -1
     * @throws FileStoreException (NOT_FOUND) if the file does not exist
     */
    static StoredFile adjustCount(IFileStoreTransaction& tx, const FileId& fileId, int delta) {
        if (delta != 1 && delta != -1) {
            throw std::invalid_argument(
                "Reference count delta must be +1 or -1, got " + std::to_string(delta));
        }

        auto updated = tx.adjustReferenceCount(fileId, delta);
        if (!updated) {
            throw FileStoreException::notFound("File not found: " + fileId.toString());
        }

        spdlog::debug("[ReferenceCountMaintenance] File {} count {:+d} -> {} (saved {} bytes)",
                      fileId.toString(), delta, updated->getReferenceCount(),
                      updated->getStorageSaved());
        return std::move(*updated);
    }
};

} // namespace filestore::application::service
