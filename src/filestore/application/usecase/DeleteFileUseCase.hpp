/**
 * @file DeleteFileUseCase.hpp
 * @brief Use cases for deleting stored files and references
 */

#pragma once

#include "../response/FileStoreResponse.hpp"
#include "../exception/FileStoreException.hpp"
#include "../service/ReferenceCountMaintenance.hpp"
#include "../../domain/repository/IFileStoreRepository.hpp"
#include "../../domain/port/IBlobStoragePort.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

namespace filestore::application::usecase {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using namespace filestore::domain::port;
using namespace filestore::application::response;
using filestore::application::exception::FileStoreException;
using filestore::application::exception::rethrowAsFileStoreException;
using filestore::application::service::ReferenceCountMaintenance;

/**
 * @brief Use case for deleting a stored file
 *
 * A file can only be deleted once all its references are gone. The file row
 * is locked before the references are counted, so a reference cannot be
 * attached between the check and the delete.
 */
class DeleteFileUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;
    std::shared_ptr<IBlobStoragePort> blobStorage_;

    void releaseBlob(const std::string& key) {
        // The row is already gone; a leftover blob is only logged
        try {
            if (!blobStorage_->remove(key)) {
                spdlog::warn("[DeleteFileUseCase] Blob {} was already missing", key);
            }
        } catch (const std::exception& e) {
            spdlog::warn("[DeleteFileUseCase] Failed to release blob {}: {}", key, e.what());
        }
    }

public:
    DeleteFileUseCase(
        std::shared_ptr<IFileStoreRepository> repository,
        std::shared_ptr<IBlobStoragePort> blobStorage
    )
        : repository_(std::move(repository)),
          blobStorage_(std::move(blobStorage)) {
        if (!repository_ || !blobStorage_) {
            throw std::invalid_argument("DeleteFileUseCase: repository and blob storage are required");
        }
    }

    /**
     * @brief Execute the use case
     * @throws FileStoreException NOT_FOUND, REFERENCE_EXISTS_CONFLICT (with the
     *         live reference count), VALIDATION_ERROR or STORAGE_FAILURE
     */
    void execute(const std::string& fileIdStr) {
        try {
            auto fileId = FileId::of(fileIdStr);
            std::string blobKey;

            {
                auto tx = repository_->begin();

                auto file = tx->lockFileById(fileId);
                if (!file) {
                    throw FileStoreException::notFound("The file no longer exists.");
                }

                int64_t references = tx->countReferences(fileId);
                if (references > 0) {
                    spdlog::info("[DeleteFileUseCase] Refusing to delete {}: {} references",
                                 fileIdStr, references);
                    throw FileStoreException::referenceExists(references);
                }

                if (!tx->deleteFile(fileId)) {
                    throw FileStoreException::notFound("The file no longer exists.");
                }
                tx->commit();
                blobKey = file->getBlobKey();
            }

            spdlog::info("[DeleteFileUseCase] Deleted file {}", fileIdStr);
            releaseBlob(blobKey);

        } catch (const std::exception&) {
            rethrowAsFileStoreException("delete the file");
        }
    }
};

/**
 * @brief Use case for deleting a file reference
 *
 * Removes the reference and decrements the owner's count in one transaction.
 */
class DeleteReferenceUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;

public:
    explicit DeleteReferenceUseCase(std::shared_ptr<IFileStoreRepository> repository)
        : repository_(std::move(repository)) {
        if (!repository_) {
            throw std::invalid_argument("DeleteReferenceUseCase: repository is required");
        }
    }

    /**
     * @brief Execute the use case
     * @return The reference id and the owner's updated counters
     * @throws FileStoreException NOT_FOUND, VALIDATION_ERROR or STORAGE_FAILURE
     */
    DeleteReferenceResponse execute(const std::string& referenceIdStr) {
        try {
            auto referenceId = ReferenceId::of(referenceIdStr);
            auto tx = repository_->begin();

            auto reference = tx->lockReferenceById(referenceId);
            if (!reference) {
                throw FileStoreException::notFound("The reference no longer exists.");
            }

            const auto& ownerId = reference->getOriginalFileId();
            if (!tx->lockFileById(ownerId)) {
                throw FileStoreException::notFound("File not found: " + ownerId.toString());
            }

            if (!tx->deleteReference(referenceId)) {
                throw FileStoreException::notFound("The reference no longer exists.");
            }

            auto updated = ReferenceCountMaintenance::adjustCount(*tx, ownerId, -1);
            tx->commit();

            spdlog::info("[DeleteReferenceUseCase] Deleted reference {} of {} (count {})",
                         referenceIdStr, ownerId.toString(), updated.getReferenceCount());

            DeleteReferenceResponse response;
            response.referenceId = referenceId.toString();
            response.file = StoredFileResponse::fromDomain(updated);
            return response;

        } catch (const std::exception&) {
            rethrowAsFileStoreException("delete the reference");
        }
    }
};

} // namespace filestore::application::usecase
