/**
 * @file test_support.hpp
 * @brief Fixtures shared by the file store unit tests
 */

#pragma once

#include "filestore/infrastructure/repository/InMemoryFileStoreRepository.hpp"
#include "filestore/infrastructure/adapter/InMemoryBlobStorageAdapter.hpp"
#include "filestore/application/usecase/SubmitFileUseCase.hpp"
#include "filestore/application/usecase/DeleteFileUseCase.hpp"
#include "filestore/application/usecase/ListFilesUseCase.hpp"
#include <atomic>
#include <memory>
#include <sstream>
#include <string>

namespace testsupport {

using namespace filestore::domain::model;
using namespace filestore::domain::repository;
using namespace filestore::application::usecase;
using namespace filestore::application::command;
using filestore::infrastructure::repository::InMemoryFileStoreRepository;
using filestore::infrastructure::adapter::InMemoryBlobStorageAdapter;

constexpr const char* HELLO_SHA256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

/**
 * @brief In-memory store plus the use cases wired to it
 */
struct StoreFixture {
    std::shared_ptr<InMemoryFileStoreRepository> repository = std::make_shared<InMemoryFileStoreRepository>();
    std::shared_ptr<InMemoryBlobStorageAdapter> blobs = std::make_shared<InMemoryBlobStorageAdapter>();

    SubmitResponse submit(const std::string& content, const std::string& name, const std::string& type = "text/plain") {
        std::istringstream stream(content);
        SubmitFileUseCase useCase(repository, blobs);
        return useCase.execute(SubmitFileCommand(stream, name, type));
    }

    StoredFile fileById(const std::string& id) {
        auto file = repository->findFileById(FileId::of(id));
        if (!file) {
            throw std::runtime_error("missing file " + id);
        }
        return *file;
    }
};

/**
 * @brief Transaction that forwards every call; decorators override what they perturb
 */
class ForwardingTransaction : public IFileStoreTransaction {
public:
    explicit ForwardingTransaction(std::unique_ptr<IFileStoreTransaction> inner)
        : inner_(std::move(inner)) {}

    std::optional<StoredFile> findFileByHash(const ContentHash& hash) override { return inner_->findFileByHash(hash); }
    std::optional<StoredFile> findFileById(const FileId& id) override { return inner_->findFileById(id); }
    std::optional<StoredFile> lockFileById(const FileId& id) override { return inner_->lockFileById(id); }
    void insertFile(const StoredFile& file) override { inner_->insertFile(file); }
    void insertReference(const FileReference& reference) override { inner_->insertReference(reference); }
    std::optional<FileReference> lockReferenceById(const ReferenceId& id) override { return inner_->lockReferenceById(id); }
    std::optional<FileReference> findReferenceByName(const FileName& name) override { return inner_->findReferenceByName(name); }
    int64_t countReferences(const FileId& id) override { return inner_->countReferences(id); }
    std::optional<StoredFile> adjustReferenceCount(const FileId& id, int delta) override {
        return inner_->adjustReferenceCount(id, delta);
    }
    bool deleteFile(const FileId& id) override { return inner_->deleteFile(id); }
    bool deleteReference(const ReferenceId& id) override { return inner_->deleteReference(id); }
    bool setContentHash(const FileId& id, const ContentHash& hash) override { return inner_->setContentHash(id, hash); }
    void commit() override { inner_->commit(); }
    void rollback() override { inner_->rollback(); }

protected:
    std::unique_ptr<IFileStoreTransaction> inner_;
};

/**
 * @brief Repository whose transactions are wrapped by wrap()
 */
class ForwardingRepository : public IFileStoreRepository {
public:
    explicit ForwardingRepository(std::shared_ptr<IFileStoreRepository> inner)
        : inner_(std::move(inner)) {}

    std::unique_ptr<IFileStoreTransaction> begin() override {
        return wrap(inner_->begin());
    }

    std::optional<StoredFile> findFileById(const FileId& id) override { return inner_->findFileById(id); }
    Page<StoredFile> findFiles(const FileQuery& query) override { return inner_->findFiles(query); }
    std::vector<FileReference> findReferences(const std::optional<FileId>& id) override { return inner_->findReferences(id); }
    StorageStatistics getStatistics() override { return inner_->getStatistics(); }
    std::vector<StoredFile> findFilesMissingHash(int limit, const std::optional<FileCursor>& after) override {
        return inner_->findFilesMissingHash(limit, after);
    }

protected:
    virtual std::unique_ptr<IFileStoreTransaction> wrap(std::unique_ptr<IFileStoreTransaction> tx) = 0;

    std::shared_ptr<IFileStoreRepository> inner_;
};

/**
 * @brief Transaction whose digest lookup misses while the shared budget lasts
 *
 * Reproduces a submission that looked the digest up just before a concurrent
 * submission committed it.
 */
class HashBlindTransaction : public ForwardingTransaction {
public:
    HashBlindTransaction(std::unique_ptr<IFileStoreTransaction> inner, std::atomic<int>& blindLookups)
        : ForwardingTransaction(std::move(inner)), blindLookups_(blindLookups) {}

    std::optional<StoredFile> findFileByHash(const ContentHash& hash) override {
        if (blindLookups_.fetch_sub(1) > 0) {
            return std::nullopt;
        }
        return inner_->findFileByHash(hash);
    }

private:
    std::atomic<int>& blindLookups_;
};

class HashBlindRepository : public ForwardingRepository {
public:
    HashBlindRepository(std::shared_ptr<IFileStoreRepository> inner, int blindLookups)
        : ForwardingRepository(std::move(inner)), blindLookups_(blindLookups) {}

protected:
    std::unique_ptr<IFileStoreTransaction> wrap(std::unique_ptr<IFileStoreTransaction> tx) override {
        return std::make_unique<HashBlindTransaction>(std::move(tx), blindLookups_);
    }

private:
    std::atomic<int> blindLookups_;
};

/**
 * @brief Transaction whose digest lookup returns a file that has since been deleted
 *
 * Reproduces a deleteFile that committed between a submission's digest lookup
 * and its row lock. With staleLock the row lock also returns the stale row, so
 * the deletion only shows up when the reference insert hits the foreign key.
 */
class VanishedOwnerTransaction : public ForwardingTransaction {
public:
    VanishedOwnerTransaction(std::unique_ptr<IFileStoreTransaction> inner, const StoredFile& vanished,
                             bool staleLock, std::atomic<int>& staleLookups)
        : ForwardingTransaction(std::move(inner)), vanished_(vanished), staleLock_(staleLock),
          staleLookups_(staleLookups) {}

    std::optional<StoredFile> findFileByHash(const ContentHash& hash) override {
        if (vanished_.getContentHash() && vanished_.getContentHash()->toString() == hash.toString() &&
            staleLookups_.fetch_sub(1) > 0) {
            servedStale_ = true;
            return vanished_;
        }
        return inner_->findFileByHash(hash);
    }

    std::optional<StoredFile> lockFileById(const FileId& id) override {
        if (staleLock_ && servedStale_ && id.toString() == vanished_.getId().toString()) {
            return vanished_;
        }
        return inner_->lockFileById(id);
    }

private:
    StoredFile vanished_;
    bool staleLock_;
    std::atomic<int>& staleLookups_;
    bool servedStale_ = false;
};

class VanishedOwnerRepository : public ForwardingRepository {
public:
    VanishedOwnerRepository(std::shared_ptr<IFileStoreRepository> inner, StoredFile vanished, bool staleLock)
        : ForwardingRepository(std::move(inner)), vanished_(std::move(vanished)), staleLock_(staleLock) {}

protected:
    std::unique_ptr<IFileStoreTransaction> wrap(std::unique_ptr<IFileStoreTransaction> tx) override {
        return std::make_unique<VanishedOwnerTransaction>(std::move(tx), vanished_, staleLock_, staleLookups_);
    }

private:
    StoredFile vanished_;
    bool staleLock_;
    std::atomic<int> staleLookups_{1};
};

} // namespace testsupport
