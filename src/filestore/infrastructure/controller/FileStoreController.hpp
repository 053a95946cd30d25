/**
 * @file FileStoreController.hpp
 * @brief Maps file store use cases onto status codes and JSON bodies
 */

#pragma once

#include "../../application/usecase/SubmitFileUseCase.hpp"
#include "../../application/usecase/DeleteFileUseCase.hpp"
#include "../../application/usecase/ListFilesUseCase.hpp"
#include "../../application/usecase/BackfillContentHashUseCase.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace filestore::infrastructure::controller {

using namespace filestore::application::usecase;
using namespace filestore::application::command;
using namespace filestore::domain::repository;
using namespace filestore::domain::port;
using namespace filestore::domain::service;
using filestore::domain::model::StoreErrorKind;

/**
 * @brief HTTP-style result: status code plus JSON body
 */
struct ApiResult {
    int status = 200;
    nlohmann::json body;

    [[nodiscard]] bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Controller for the file store API
 *
 * Status codes: 201 upload, 200 reads and reference deletion, 204 file
 * deletion, 400 validation, 404 not found, 409 conflicts, 500 storage failure.
 */
class FileStoreController {
private:
    std::shared_ptr<IFileStoreRepository> repository_;
    std::shared_ptr<SubmitFileUseCase> submitFileUseCase_;
    std::shared_ptr<DeleteFileUseCase> deleteFileUseCase_;
    std::shared_ptr<DeleteReferenceUseCase> deleteReferenceUseCase_;
    std::shared_ptr<ListFilesUseCase> listFilesUseCase_;
    std::shared_ptr<ListReferencesUseCase> listReferencesUseCase_;
    std::shared_ptr<GetStorageStatisticsUseCase> getStatisticsUseCase_;
    std::shared_ptr<BackfillContentHashUseCase> backfillUseCase_;
    bool exposeDetail_;

    ApiResult createErrorResponse(const application::exception::FileStoreException& e) const;

    template <typename Fn>
    ApiResult handle(const char* operation, int successStatus, Fn&& fn) const;

public:
    /**
     * @param exposeDetail Include internal diagnostics in error bodies (DEBUG)
     */
    FileStoreController(
        std::shared_ptr<IFileStoreRepository> repository,
        std::shared_ptr<IBlobStoragePort> blobStorage,
        ContentHasher hasher = ContentHasher(),
        int maxSubmitAttempts = SubmitFileUseCase::DEFAULT_MAX_ATTEMPTS,
        bool exposeDetail = false
    );

    /**
     * @brief Map a failure kind to its status code
     */
    static int statusFor(StoreErrorKind kind);

    /**
     * @brief Submit content: 201 with the outcome ("original" or "reference")
     */
    ApiResult upload(
        std::istream& content,
        const std::string& filename,
        const std::string& contentType = "",
        int64_t declaredSize = -1
    );

    /**
     * @brief Delete a stored file: 204, or 409 with referenceCount
     */
    ApiResult deleteFile(const std::string& fileId);

    /**
     * @brief Delete a reference: 200 with the owner's updated counters
     */
    ApiResult deleteReference(const std::string& referenceId);

    ApiResult listFiles(const ListFilesCommand& command);

    ApiResult listReferences(const std::optional<std::string>& fileId = std::nullopt);

    ApiResult statistics();

    ApiResult backfill(int batchSize = 100);
};

} // namespace filestore::infrastructure::controller
