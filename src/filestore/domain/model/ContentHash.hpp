/**
 * @file ContentHash.hpp
 * @brief Value Object for content digest (SHA-256)
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace filestore::domain::model {

/**
 * @brief Content Hash Value Object
 *
 * Lowercase hex form of a SHA-256 digest. The sole identity key used for
 * deduplication.
 */
class ContentHash : public shared::domain::StringValueObject {
public:
    static constexpr size_t SHA256_HEX_LENGTH = 64;

private:
    explicit ContentHash(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const {
        bool valid = value_.length() == SHA256_HEX_LENGTH;
        for (size_t i = 0; valid && i < value_.length(); ++i) {
            char c = value_[i];
            valid = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        }

        if (!valid) {
            throw shared::exception::DomainException(
                "INVALID_CONTENT_HASH",
                "Content hash must be a 64-character hexadecimal SHA-256 hash"
            );
        }
    }

public:
    /**
     * @brief Create from existing hash string
     */
    static ContentHash of(const std::string& value) {
        // Normalize to lowercase
        std::string normalized = value;
        for (char& c : normalized) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return ContentHash(normalized);
    }

    /**
     * @brief Create from a raw 32-byte digest
     */
    static ContentHash fromDigest(const unsigned char* digest, size_t length) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < length; ++i) {
            ss << std::setw(2) << static_cast<int>(digest[i]);
        }
        return ContentHash(ss.str());
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace filestore::domain::model
