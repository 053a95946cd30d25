/**
 * @file InfrastructureException.hpp
 * @brief Infrastructure layer exception class
 */

#pragma once

#include "CodedException.hpp"

namespace shared::exception {

/**
 * @brief Exception for infrastructure layer errors
 *
 * Used by the blob storage adapters and other I/O facing code.
 */
class InfrastructureException : public CodedException {
public:
    /**
     * @param code Error code (e.g., "STORAGE_ERROR")
     * @param message Human-readable error message
     */
    InfrastructureException(std::string code, std::string message)
        : CodedException(std::move(code), std::move(message)) {}
};

} // namespace shared::exception
