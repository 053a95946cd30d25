/**
 * @file BackfillContentHashUseCase.hpp
 * @brief Use case for computing the digest of legacy files stored without one
 */

#pragma once

#include "../response/FileStoreResponse.hpp"
#include "../exception/FileStoreException.hpp"
#include "../../domain/repository/IFileStoreRepository.hpp"
#include "../../domain/port/IBlobStoragePort.hpp"
#include "../../domain/service/ContentHasher.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/lib/exception/exceptions.h"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

namespace filestore::application::usecase {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using namespace filestore::domain::port;
using namespace filestore::domain::service;
using namespace filestore::application::response;
using filestore::application::exception::FileStoreException;
using filestore::application::exception::rethrowAsFileStoreException;

/**
 * @brief Backfill content_hash for files created before hashing existed
 *
 * Each file is hashed from its blob outside any transaction, then the hash
 * is written under a row lock. A file whose content is already held by
 * another file keeps a null hash and is reported as a duplicate; such files
 * need manual merging.
 */
class BackfillContentHashUseCase {
private:
    std::shared_ptr<IFileStoreRepository> repository_;
    std::shared_ptr<IBlobStoragePort> blobStorage_;
    ContentHasher hasher_;

    /**
     * @return the digest, or nullopt when the blob is missing or does not match the recorded size
     */
    std::optional<ContentHash> hashBlob(const StoredFile& file) {
        try {
            auto stream = blobStorage_->openStream(file.getBlobKey());
            auto digest = hasher_.digest(*stream);
            if (digest.bytes != file.getSize().toBytes()) {
                spdlog::warn("[BackfillContentHashUseCase] Blob {} has {} bytes, record says {}",
                             file.getBlobKey(), digest.bytes, file.getSize().toBytes());
                return std::nullopt;
            }
            return digest.hash;
        } catch (const shared::exception::InfrastructureException& e) {
            spdlog::warn("[BackfillContentHashUseCase] Cannot read blob {} of file {}: {}",
                         file.getBlobKey(), file.getId().toString(), e.getMessage());
            return std::nullopt;
        }
    }

    void backfillOne(const StoredFile& file, BackfillReport& report) {
        ++report.scanned;
        const auto fileId = file.getId().toString();

        auto hash = hashBlob(file);
        if (!hash) {
            ++report.failed;
            report.failedFileIds.push_back(fileId);
            return;
        }

        try {
            auto tx = repository_->begin();
            auto locked = tx->lockFileById(file.getId());
            if (!locked || locked->getContentHash()) {
                // Deleted or filled in since the scan
                return;
            }
            tx->setContentHash(file.getId(), *hash);
            tx->commit();
            ++report.updated;
        } catch (const common::UniqueViolationException& e) {
            spdlog::warn("[BackfillContentHashUseCase] File {} duplicates existing content {} ({})",
                         fileId, hash->toString(), e.getConstraint());
            ++report.duplicates;
            report.duplicateFileIds.push_back(fileId);
        }
    }

public:
    static constexpr int MAX_BATCH_SIZE = 1000;

    BackfillContentHashUseCase(
        std::shared_ptr<IFileStoreRepository> repository,
        std::shared_ptr<IBlobStoragePort> blobStorage,
        ContentHasher hasher = ContentHasher()
    )
        : repository_(std::move(repository)),
          blobStorage_(std::move(blobStorage)),
          hasher_(hasher) {
        if (!repository_ || !blobStorage_) {
            throw std::invalid_argument("BackfillContentHashUseCase: repository and blob storage are required");
        }
    }

    /**
     * @brief Walk every legacy file, reading batchSize rows per query
     * @throws FileStoreException VALIDATION_ERROR for a bad batch size,
     *         STORAGE_FAILURE if the store cannot be read
     */
    BackfillReport execute(int batchSize = 100) {
        try {
            if (batchSize < 1 || batchSize > MAX_BATCH_SIZE) {
                throw FileStoreException::validation(
                    "batch size must be between 1 and " + std::to_string(MAX_BATCH_SIZE));
            }

            // Keyset paging: rows left null by this run stay behind the cursor
            BackfillReport report;
            std::optional<FileCursor> cursor;
            while (true) {
                auto batch = repository_->findFilesMissingHash(batchSize, cursor);
                for (const auto& file : batch) {
                    backfillOne(file, report);
                }
                if (static_cast<int>(batch.size()) < batchSize) {
                    break;
                }
                cursor = FileCursor{batch.back().getUploadedAt(), batch.back().getId().toString()};
            }

            spdlog::info("[BackfillContentHashUseCase] scanned={}, updated={}, duplicates={}, failed={}",
                         report.scanned, report.updated, report.duplicates, report.failed);
            return report;

        } catch (const std::exception&) {
            rethrowAsFileStoreException("backfill content hashes");
        }
    }
};

} // namespace filestore::application::usecase
