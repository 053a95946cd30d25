/**
 * @file FileId.hpp
 * @brief Value Object for stored file identity (UUID v4)
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <string>

namespace filestore::domain::model {

/**
 * @brief Stored File ID Value Object (UUID v4)
 */
class FileId : public shared::domain::StringValueObject {
private:
    explicit FileId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const {
        if (!shared::util::UuidUtil::isValidV4(value_)) {
            throw shared::exception::DomainException(
                "INVALID_FILE_ID",
                "File ID must be a valid UUID v4: " + value_
            );
        }
    }

public:
    /**
     * @brief Create from existing UUID string (normalized to lowercase)
     */
    static FileId of(const std::string& value) {
        return FileId(shared::util::UuidUtil::normalize(value));
    }

    /**
     * @brief Generate a new UUID v4
     */
    static FileId generate() {
        return FileId(shared::util::UuidUtil::generate());
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace filestore::domain::model
