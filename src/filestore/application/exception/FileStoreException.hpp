/**
 * @file FileStoreException.hpp
 * @brief Structured failure outcome of file store use cases
 */

#pragma once

#include "shared/exception/ApplicationException.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/exception/InfrastructureException.hpp"
#include "shared/lib/exception/exceptions.h"
#include "../../domain/model/StoreErrorKind.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <optional>
#include <string>

namespace filestore::application::exception {

using filestore::domain::model::StoreErrorKind;

/**
 * @brief Application exception carrying a StoreErrorKind
 *
 * getMessage() is safe to show to end users. getDetail() holds the internal
 * diagnostic (e.g. the database error text) and is only exposed in debug
 * deployments.
 */
class FileStoreException : public shared::exception::ApplicationException {
private:
    StoreErrorKind kind_;
    std::optional<std::string> existingName_;
    std::optional<int64_t> referenceCount_;
    std::string detail_;

    FileStoreException(StoreErrorKind kind, std::string message)
        : ApplicationException(domain::model::toString(kind), std::move(message)),
          kind_(kind) {}

public:
    static FileStoreException validation(std::string message, std::string detail = "") {
        FileStoreException ex(StoreErrorKind::VALIDATION_ERROR, std::move(message));
        ex.detail_ = std::move(detail);
        return ex;
    }

    /**
     * @param existingName Original filename of the file already holding the content
     */
    static FileStoreException duplicateName(std::string message, std::string existingName) {
        FileStoreException ex(StoreErrorKind::DUPLICATE_NAME_CONFLICT, std::move(message));
        ex.existingName_ = std::move(existingName);
        return ex;
    }

    static FileStoreException referenceExists(int64_t referenceCount) {
        FileStoreException ex(
            StoreErrorKind::REFERENCE_EXISTS_CONFLICT,
            "This file has " + std::to_string(referenceCount) +
                " references. Delete the references first."
        );
        ex.referenceCount_ = referenceCount;
        return ex;
    }

    static FileStoreException notFound(std::string message) {
        return FileStoreException(StoreErrorKind::NOT_FOUND, std::move(message));
    }

    static FileStoreException storageFailure(std::string message, std::string detail = "") {
        FileStoreException ex(StoreErrorKind::STORAGE_FAILURE, std::move(message));
        ex.detail_ = std::move(detail);
        return ex;
    }

    [[nodiscard]] StoreErrorKind getKind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<std::string>& getExistingName() const noexcept { return existingName_; }
    [[nodiscard]] const std::optional<int64_t>& getReferenceCount() const noexcept { return referenceCount_; }
    [[nodiscard]] const std::string& getDetail() const noexcept { return detail_; }
};

/**
 * @brief Rethrow the in-flight exception as a FileStoreException
 *
 * Must be called from inside a catch block. FileStoreException passes
 * through unchanged; domain rule violations become VALIDATION_ERROR and
 * everything else STORAGE_FAILURE, so raw storage errors never reach callers.
 *
 * @param operation Short name used in the log line and failure message
 */
[[noreturn]] inline void rethrowAsFileStoreException(const std::string& operation) {
    try {
        throw;
    } catch (const FileStoreException&) {
        throw;
    } catch (const shared::exception::DomainException& e) {
        spdlog::warn("[FileStore] {} rejected: {} - {}", operation, e.getCode(), e.getMessage());
        throw FileStoreException::validation(e.getMessage(), e.getCode());
    } catch (const shared::exception::InfrastructureException& e) {
        spdlog::error("[FileStore] {} failed: {} - {}", operation, e.getCode(), e.getMessage());
        throw FileStoreException::storageFailure("Failed to " + operation, e.getMessage());
    } catch (const common::FileHubException& e) {
        spdlog::error("[FileStore] {} failed: {}", operation, e.what());
        throw FileStoreException::storageFailure("Failed to " + operation, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[FileStore] {} failed unexpectedly: {}", operation, e.what());
        throw FileStoreException::storageFailure("Failed to " + operation, e.what());
    }
}

} // namespace filestore::application::exception
