/**
 * @file SubmitFileUseCase.cpp
 * @brief Deduplicating submission
 */

#include "SubmitFileUseCase.hpp"
#include "../service/ReferenceCountMaintenance.hpp"
#include "shared/lib/exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace filestore::application::usecase {

using filestore::application::exception::FileStoreException;
using filestore::application::exception::rethrowAsFileStoreException;
using filestore::application::service::ReferenceCountMaintenance;

namespace {

/**
 * @brief Releases a freshly written blob unless the owning row committed
 */
class BlobKeyGuard {
public:
    BlobKeyGuard(IBlobStoragePort& storage, std::string key)
        : storage_(storage), key_(std::move(key)) {}

    ~BlobKeyGuard() {
        if (dismissed_) {
            return;
        }
        try {
            if (!storage_.remove(key_)) {
                spdlog::warn("[SubmitFileUseCase] Orphaned blob {} was already gone", key_);
            }
        } catch (const std::exception& e) {
            spdlog::warn("[SubmitFileUseCase] Failed to release orphaned blob {}: {}", key_, e.what());
        }
    }

    BlobKeyGuard(const BlobKeyGuard&) = delete;
    BlobKeyGuard& operator=(const BlobKeyGuard&) = delete;

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    void dismiss() noexcept { dismissed_ = true; }

private:
    IBlobStoragePort& storage_;
    std::string key_;
    bool dismissed_ = false;
};

} // namespace

SubmitFileUseCase::SubmitFileUseCase(
    std::shared_ptr<IFileStoreRepository> repository,
    std::shared_ptr<IBlobStoragePort> blobStorage,
    ContentHasher hasher,
    int maxAttempts
)
    : repository_(std::move(repository)),
      blobStorage_(std::move(blobStorage)),
      hasher_(hasher),
      maxAttempts_(maxAttempts)
{
    if (!repository_ || !blobStorage_) {
        throw std::invalid_argument("SubmitFileUseCase: repository and blob storage are required");
    }
    if (maxAttempts_ < 1) {
        throw std::invalid_argument("SubmitFileUseCase: maxAttempts must be at least 1");
    }
}

SubmitResponse SubmitFileUseCase::execute(const SubmitFileCommand& command) {
    try {
        if (!command.content) {
            throw FileStoreException::validation("No file provided");
        }

        auto digest = hasher_.digest(*command.content);

        if (digest.bytes == 0) {
            throw FileStoreException::validation("The submitted file is empty");
        }
        if (command.declaredSize >= 0 && command.declaredSize != digest.bytes) {
            throw FileStoreException::validation(
                "Declared size " + std::to_string(command.declaredSize) +
                " does not match content size " + std::to_string(digest.bytes)
            );
        }
        if (command.contentType.length() > MAX_CONTENT_TYPE_LENGTH) {
            throw FileStoreException::validation(
                "Content type exceeds maximum length of " + std::to_string(MAX_CONTENT_TYPE_LENGTH)
            );
        }

        auto filename = FileName::of(command.filename);

        spdlog::info("[SubmitFileUseCase] Submit '{}' ({} bytes, hash {})",
                     filename.toString(), digest.bytes, digest.hash.toString());

        for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
            auto tx = repository_->begin();

            auto existing = tx->findFileByHash(digest.hash);
            auto result = existing
                ? submitAsReference(*tx, *existing, filename)
                : submitAsOriginal(*tx, command, filename, digest);

            if (result) {
                return std::move(*result);
            }

            spdlog::warn("[SubmitFileUseCase] Attempt {}/{} for hash {} raced with a concurrent change, retrying",
                         attempt, maxAttempts_, digest.hash.toString());
        }

        throw FileStoreException::storageFailure(
            "Could not store the file. Please try again.",
            "gave up after " + std::to_string(maxAttempts_) + " attempts"
        );

    } catch (const std::exception&) {
        rethrowAsFileStoreException("upload the file");
    }
}

std::optional<SubmitResponse> SubmitFileUseCase::submitAsReference(
    IFileStoreTransaction& tx,
    const StoredFile& existing,
    const FileName& referenceName
) {
    const std::string holder = existing.getOriginalFilename().toString();
    const std::string clashMessage =
        "This file appears to be identical to " + holder +
        " and a reference named '" + referenceName.toString() + "' already exists";

    spdlog::debug("[SubmitFileUseCase] Content already held by {} ('{}')",
                  existing.getId().toString(), holder);

    // Serialises against a concurrent deleteFile of the same owner
    if (!tx.lockFileById(existing.getId())) {
        spdlog::warn("[SubmitFileUseCase] File {} was deleted after lookup", existing.getId().toString());
        tx.rollback();
        return std::nullopt;
    }

    if (tx.findReferenceByName(referenceName)) {
        spdlog::warn("[SubmitFileUseCase] Reference name '{}' is taken", referenceName.toString());
        throw FileStoreException::duplicateName(clashMessage, holder);
    }

    auto reference = FileReference::create(existing.getId(), referenceName);

    try {
        tx.insertReference(reference);
    } catch (const common::UniqueViolationException& e) {
        if (e.getConstraint() != constraint::REFERENCE_NAME_UNIQUE) {
            throw;
        }
        // A concurrent submission claimed the name after the pre-check
        spdlog::warn("[SubmitFileUseCase] Reference name '{}' was taken concurrently",
                     referenceName.toString());
        tx.rollback();
        throw FileStoreException::duplicateName(clashMessage, holder);
    } catch (const common::ForeignKeyViolationException&) {
        spdlog::warn("[SubmitFileUseCase] File {} was deleted before the reference could be attached",
                     existing.getId().toString());
        tx.rollback();
        return std::nullopt;
    }

    auto updated = ReferenceCountMaintenance::adjustCount(tx, existing.getId(), +1);
    tx.commit();

    spdlog::info("[SubmitFileUseCase] Created reference {} -> {} (count {})",
                 reference.getId().toString(), existing.getId().toString(),
                 updated.getReferenceCount());

    SubmitResponse response;
    response.type = SubmitOutcome::REFERENCE;
    response.file = StoredFileResponse::fromDomain(updated);
    response.reference = FileReferenceResponse::fromDomain(reference);
    response.message = "File content already exists as " + holder + ". Created a reference instead.";
    return response;
}

std::optional<SubmitResponse> SubmitFileUseCase::submitAsOriginal(
    IFileStoreTransaction& tx,
    const SubmitFileCommand& command,
    const FileName& filename,
    const ContentDigest& digest
) {
    BlobKeyGuard blob(*blobStorage_, blobStorage_->put(*command.content, filename.getExtension()));

    auto file = StoredFile::create(
        filename,
        command.contentType,
        FileSize::ofBytes(digest.bytes),
        digest.hash,
        blob.key()
    );

    try {
        tx.insertFile(file);
        tx.commit();
    } catch (const common::UniqueViolationException& e) {
        if (e.getConstraint() != constraint::CONTENT_HASH_UNIQUE) {
            throw;
        }
        spdlog::warn("[SubmitFileUseCase] Lost creation race for hash {}, resolving as reference",
                     digest.hash.toString());
        tx.rollback();
        return std::nullopt;
    }

    blob.dismiss();

    spdlog::info("[SubmitFileUseCase] Stored new file {} ('{}', {} bytes, blob {})",
                 file.getId().toString(), filename.toString(), digest.bytes, file.getBlobKey());

    SubmitResponse response;
    response.type = SubmitOutcome::ORIGINAL;
    response.file = StoredFileResponse::fromDomain(file);
    response.message = "File uploaded successfully";
    return response;
}

} // namespace filestore::application::usecase
