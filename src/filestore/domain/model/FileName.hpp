/**
 * @file FileName.hpp
 * @brief Value Object for file and reference display names
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include <cstdint>
#include <string>

namespace filestore::domain::model {

/**
 * @brief File Name Value Object
 *
 * Used both for a stored file's original filename and for a reference name.
 */
class FileName : public shared::domain::StringValueObject {
public:
    static constexpr size_t MAX_LENGTH = 255;

private:
    explicit FileName(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const {
        if (value_.empty()) {
            throw shared::exception::DomainException(
                "INVALID_FILE_NAME",
                "File name cannot be empty"
            );
        }

        if (value_.length() > MAX_LENGTH) {
            throw shared::exception::DomainException(
                "INVALID_FILE_NAME",
                "File name exceeds maximum length of " + std::to_string(MAX_LENGTH)
            );
        }

        if (!isValidUtf8(value_)) {
            throw shared::exception::DomainException(
                "INVALID_FILE_NAME",
                "File name is not valid UTF-8"
            );
        }

        // Control characters and path/shell metacharacters
        static const std::string invalidChars = "<>:\"|?*\\/";
        for (char c : value_) {
            auto byte = static_cast<unsigned char>(c);
            if (invalidChars.find(c) != std::string::npos || byte < 32 || byte == 127) {
                throw shared::exception::DomainException(
                    "INVALID_FILE_NAME",
                    "File name contains invalid characters"
                );
            }
        }
    }

    /**
     * @brief Well-formed UTF-8: shortest encodings only, no surrogates, at most U+10FFFF
     */
    static bool isValidUtf8(const std::string& text) {
        size_t i = 0;
        while (i < text.size()) {
            auto lead = static_cast<unsigned char>(text[i]);
            size_t length;
            uint32_t codePoint;
            if (lead < 0x80) {
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                length = 2;
                codePoint = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                codePoint = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                codePoint = lead & 0x07;
            } else {
                return false;
            }

            if (i + length > text.size()) {
                return false;
            }
            for (size_t k = 1; k < length; ++k) {
                auto next = static_cast<unsigned char>(text[i + k]);
                if ((next & 0xC0) != 0x80) {
                    return false;
                }
                codePoint = (codePoint << 6) | (next & 0x3F);
            }

            static constexpr uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
            if (codePoint < minimum[length] || codePoint > 0x10FFFF ||
                (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
                return false;
            }
            i += length;
        }
        return true;
    }

public:
    static FileName of(const std::string& value) {
        return FileName(value);
    }

    /**
     * @brief Get file extension (without dot), empty if none
     */
    [[nodiscard]] std::string getExtension() const {
        size_t dotPos = value_.rfind('.');
        if (dotPos == std::string::npos || dotPos == 0 || dotPos == value_.length() - 1) {
            return "";
        }
        return value_.substr(dotPos + 1);
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace filestore::domain::model
