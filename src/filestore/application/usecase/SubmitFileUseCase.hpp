/**
 * @file SubmitFileUseCase.hpp
 * @brief Use case for submitting content: store new content once, reference duplicates
 */

#pragma once

#include "../command/FileStoreCommands.hpp"
#include "../response/FileStoreResponse.hpp"
#include "../exception/FileStoreException.hpp"
#include "../../domain/model/StoredFile.hpp"
#include "../../domain/model/FileName.hpp"
#include "../../domain/repository/IFileStoreRepository.hpp"
#include "../../domain/port/IBlobStoragePort.hpp"
#include "../../domain/service/ContentHasher.hpp"
#include <memory>
#include <optional>

namespace filestore::application::usecase {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using namespace filestore::domain::port;
using namespace filestore::domain::service;
using namespace filestore::application::command;
using namespace filestore::application::response;

/**
 * @brief Deduplicating submission
 *
 * 1. Hash the content and validate the command.
 * 2. Look the digest up inside a transaction.
 * 3. Found: check the reference name, insert a FileReference and bump the
 *    owner's count, all in that transaction.
 * 4. Not found: store the blob and insert a new StoredFile. If another
 *    submission committed the same digest first, the unique constraint on the
 *    hash rejects the insert and the submission is re-resolved as step 3 in
 *    a fresh transaction.
 *
 * Every failure is reported as FileStoreException.
 */
class SubmitFileUseCase {
public:
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr size_t MAX_CONTENT_TYPE_LENGTH = 100;

    /**
     * @param maxAttempts Upper bound on create/reference resolution rounds
     * @throws std::invalid_argument if a dependency is null or maxAttempts < 1
     */
    SubmitFileUseCase(
        std::shared_ptr<IFileStoreRepository> repository,
        std::shared_ptr<IBlobStoragePort> blobStorage,
        ContentHasher hasher = ContentHasher(),
        int maxAttempts = DEFAULT_MAX_ATTEMPTS
    );

    /**
     * @brief Execute the use case
     * @throws exception::FileStoreException
     */
    SubmitResponse execute(const SubmitFileCommand& command);

private:
    std::shared_ptr<IFileStoreRepository> repository_;
    std::shared_ptr<IBlobStoragePort> blobStorage_;
    ContentHasher hasher_;
    int maxAttempts_;

    /**
     * @return nullopt when the owning file vanished and the round must be retried
     */
    std::optional<SubmitResponse> submitAsReference(
        IFileStoreTransaction& tx,
        const StoredFile& existing,
        const FileName& referenceName
    );

    /**
     * @return nullopt when another submission created the digest first
     */
    std::optional<SubmitResponse> submitAsOriginal(
        IFileStoreTransaction& tx,
        const SubmitFileCommand& command,
        const FileName& filename,
        const ContentDigest& digest
    );
};

} // namespace filestore::application::usecase
