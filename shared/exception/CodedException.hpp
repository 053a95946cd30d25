/**
 * @file CodedException.hpp
 * @brief Base class for exceptions that carry a machine readable code
 */

#pragma once

#include <stdexcept>
#include <string>

namespace shared::exception {

/**
 * @brief Exception with an error code and a human-readable message
 *
 * The layer specific exceptions (domain, infrastructure, application)
 * derive from this so callers can log and classify them uniformly.
 */
class CodedException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

protected:
    CodedException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

public:
    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

} // namespace shared::exception
