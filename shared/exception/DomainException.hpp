/**
 * @file DomainException.hpp
 * @brief Domain layer exception class
 */

#pragma once

#include "CodedException.hpp"

namespace shared::exception {

/**
 * @brief Exception for domain layer errors
 *
 * Thrown when a value object or entity rejects its input, e.g. a malformed
 * content hash or an empty file name.
 */
class DomainException : public CodedException {
public:
    /**
     * @param code Error code (e.g., "INVALID_CONTENT_HASH")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : CodedException(std::move(code), std::move(message)) {}
};

} // namespace shared::exception
