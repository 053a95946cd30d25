/**
 * @file StoreErrorKind.hpp
 * @brief Enum for file store failure kinds
 */

#pragma once

#include <string>
#include <stdexcept>

namespace filestore::domain::model {

/**
 * @brief Failure taxonomy reported to callers of the file store
 */
enum class StoreErrorKind {
    VALIDATION_ERROR,           // Missing, empty or malformed input
    DUPLICATE_NAME_CONFLICT,    // Reference name already taken
    REFERENCE_EXISTS_CONFLICT,  // File still has live references
    NOT_FOUND,                  // Target file or reference missing
    STORAGE_FAILURE             // Persistence or blob store failure
};

inline std::string toString(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case StoreErrorKind::DUPLICATE_NAME_CONFLICT: return "DUPLICATE_NAME_CONFLICT";
        case StoreErrorKind::REFERENCE_EXISTS_CONFLICT: return "REFERENCE_EXISTS_CONFLICT";
        case StoreErrorKind::NOT_FOUND: return "NOT_FOUND";
        case StoreErrorKind::STORAGE_FAILURE: return "STORAGE_FAILURE";
        default: throw std::invalid_argument("Unknown StoreErrorKind");
    }
}

inline StoreErrorKind parseStoreErrorKind(const std::string& str) {
    if (str == "VALIDATION_ERROR") return StoreErrorKind::VALIDATION_ERROR;
    if (str == "DUPLICATE_NAME_CONFLICT") return StoreErrorKind::DUPLICATE_NAME_CONFLICT;
    if (str == "REFERENCE_EXISTS_CONFLICT") return StoreErrorKind::REFERENCE_EXISTS_CONFLICT;
    if (str == "NOT_FOUND") return StoreErrorKind::NOT_FOUND;
    if (str == "STORAGE_FAILURE") return StoreErrorKind::STORAGE_FAILURE;
    throw std::invalid_argument("Unknown store error kind: " + str);
}

} // namespace filestore::domain::model
