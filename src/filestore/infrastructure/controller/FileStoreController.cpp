/**
 * @file FileStoreController.cpp
 * @brief Maps file store use cases onto status codes and JSON bodies
 */

#include "FileStoreController.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace filestore::infrastructure::controller {

using filestore::application::exception::FileStoreException;

FileStoreController::FileStoreController(
    std::shared_ptr<IFileStoreRepository> repository,
    std::shared_ptr<IBlobStoragePort> blobStorage,
    ContentHasher hasher,
    int maxSubmitAttempts,
    bool exposeDetail
)
    : repository_(repository),
      submitFileUseCase_(std::make_shared<SubmitFileUseCase>(repository, blobStorage, hasher, maxSubmitAttempts)),
      deleteFileUseCase_(std::make_shared<DeleteFileUseCase>(repository, blobStorage)),
      deleteReferenceUseCase_(std::make_shared<DeleteReferenceUseCase>(repository)),
      listFilesUseCase_(std::make_shared<ListFilesUseCase>(repository)),
      listReferencesUseCase_(std::make_shared<ListReferencesUseCase>(repository)),
      getStatisticsUseCase_(std::make_shared<GetStorageStatisticsUseCase>(repository)),
      backfillUseCase_(std::make_shared<BackfillContentHashUseCase>(repository, blobStorage, hasher)),
      exposeDetail_(exposeDetail) {}

int FileStoreController::statusFor(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::VALIDATION_ERROR: return 400;
        case StoreErrorKind::NOT_FOUND: return 404;
        case StoreErrorKind::DUPLICATE_NAME_CONFLICT:
        case StoreErrorKind::REFERENCE_EXISTS_CONFLICT: return 409;
        case StoreErrorKind::STORAGE_FAILURE: return 500;
    }
    return 500;
}

ApiResult FileStoreController::createErrorResponse(const FileStoreException& e) const {
    nlohmann::json error;
    error["error"] = e.getCode();
    error["message"] = e.getMessage();
    error["timestamp"] = application::response::formatTimestamp(std::chrono::system_clock::now());

    if (e.getExistingName()) {
        error["existingFile"] = *e.getExistingName();
    }
    if (e.getReferenceCount()) {
        error["referenceCount"] = *e.getReferenceCount();
    }
    if (exposeDetail_ && !e.getDetail().empty()) {
        error["detail"] = e.getDetail();
    }

    return ApiResult{statusFor(e.getKind()), error};
}

template <typename Fn>
ApiResult FileStoreController::handle(const char* operation, int successStatus, Fn&& fn) const {
    try {
        return ApiResult{successStatus, fn()};
    } catch (const FileStoreException& e) {
        if (e.getKind() == StoreErrorKind::STORAGE_FAILURE) {
            spdlog::error("[FileStoreController] {} failed: {} - {}", operation, e.getCode(), e.getMessage());
        } else {
            spdlog::info("[FileStoreController] {} rejected: {} - {}", operation, e.getCode(), e.getMessage());
        }
        return createErrorResponse(e);
    }
}

ApiResult FileStoreController::upload(
    std::istream& content,
    const std::string& filename,
    const std::string& contentType,
    int64_t declaredSize
) {
    return handle("upload", 201, [&]() {
        SubmitFileCommand command(content, filename, contentType, declaredSize);
        return submitFileUseCase_->execute(command).toJson();
    });
}

ApiResult FileStoreController::deleteFile(const std::string& fileId) {
    return handle("delete-file", 204, [&]() {
        deleteFileUseCase_->execute(fileId);
        return nlohmann::json();
    });
}

ApiResult FileStoreController::deleteReference(const std::string& referenceId) {
    return handle("delete-reference", 200, [&]() {
        return deleteReferenceUseCase_->execute(referenceId).toJson();
    });
}

ApiResult FileStoreController::listFiles(const ListFilesCommand& command) {
    return handle("list", 200, [&]() {
        return listFilesUseCase_->execute(command).toJson();
    });
}

ApiResult FileStoreController::listReferences(const std::optional<std::string>& fileId) {
    return handle("references", 200, [&]() {
        return listReferencesUseCase_->execute(fileId).toJson();
    });
}

ApiResult FileStoreController::statistics() {
    return handle("stats", 200, [&]() {
        return getStatisticsUseCase_->execute().toJson();
    });
}

ApiResult FileStoreController::backfill(int batchSize) {
    return handle("backfill", 200, [&]() {
        return backfillUseCase_->execute(batchSize).toJson();
    });
}

} // namespace filestore::infrastructure::controller
