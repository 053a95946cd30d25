/**
 * @file FileSize.hpp
 * @brief Value Object for byte counts
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include "shared/exception/DomainException.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <sstream>
#include <iomanip>

namespace filestore::domain::model {

/**
 * @brief File Size Value Object
 *
 * Non-negative byte count. Also used for derived totals such as storage saved.
 */
class FileSize : public shared::domain::ValueObject<int64_t> {
private:
    explicit FileSize(int64_t value) : ValueObject<int64_t>(value) {
        validate();
    }

    void validate() const {
        if (value_ < 0) {
            throw shared::exception::DomainException(
                "INVALID_FILE_SIZE",
                "File size cannot be negative"
            );
        }
    }

public:
    static FileSize ofBytes(int64_t bytes) {
        return FileSize(bytes);
    }

    [[nodiscard]] int64_t toBytes() const noexcept {
        return value_;
    }

    /**
     * @brief Human-readable rendering, e.g. "512.00 B", "1.50 KB", "2.00 GB"
     *
     * Steps of 1024 up to PB, always two decimals.
     */
    [[nodiscard]] std::string toHumanReadable() const {
        static const std::array<const char*, 6> units = {"B", "KB", "MB", "GB", "TB", "PB"};

        double size = static_cast<double>(value_);
        size_t unit = 0;
        while (size >= 1024.0 && unit < units.size() - 1) {
            size /= 1024.0;
            ++unit;
        }

        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
        return ss.str();
    }

    [[nodiscard]] bool isEmpty() const noexcept {
        return value_ == 0;
    }
};

} // namespace filestore::domain::model
