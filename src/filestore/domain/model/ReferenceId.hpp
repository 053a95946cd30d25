/**
 * @file ReferenceId.hpp
 * @brief Value Object for file reference identity (UUID v4)
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include "shared/util/UuidUtil.hpp"
#include <string>

namespace filestore::domain::model {

/**
 * @brief File Reference ID Value Object (UUID v4)
 */
class ReferenceId : public shared::domain::StringValueObject {
private:
    explicit ReferenceId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const {
        if (!shared::util::UuidUtil::isValidV4(value_)) {
            throw shared::exception::DomainException(
                "INVALID_REFERENCE_ID",
                "Reference ID must be a valid UUID v4: " + value_
            );
        }
    }

public:
    /**
     * @brief Create from existing UUID string (normalized to lowercase)
     */
    static ReferenceId of(const std::string& value) {
        return ReferenceId(shared::util::UuidUtil::normalize(value));
    }

    /**
     * @brief Generate a new UUID v4
     */
    static ReferenceId generate() {
        return ReferenceId(shared::util::UuidUtil::generate());
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace filestore::domain::model
