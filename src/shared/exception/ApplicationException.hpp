/**
 * @file ApplicationException.hpp
 * @brief Application layer exception class
 */

#pragma once

#include "shared/exception/CodedException.hpp"

namespace shared::exception {

/**
 * @brief Exception for application layer errors
 *
 * Used for use case execution errors, business rule violations at application level.
 */
class ApplicationException : public CodedException {
public:
    /**
     * @brief Construct a new Application Exception
     * @param code Error code (e.g., "NOT_FOUND")
     * @param message Human-readable error message
     */
    ApplicationException(std::string code, std::string message)
        : CodedException(std::move(code), std::move(message)) {}
};

} // namespace shared::exception
