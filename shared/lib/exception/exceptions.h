/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types raised by the shared infrastructure library
 * (database, configuration, connection pool).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all FileHub infrastructure exceptions
 */
class FileHubException : public std::runtime_error {
public:
    explicit FileHubException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public FileHubException {
private:
    std::string sqlState_;

public:
    explicit DatabaseException(const std::string& message, std::string sqlState = "")
        : FileHubException("Database error: " + message),
          sqlState_(std::move(sqlState)) {}

    /**
     * @brief Five character SQLSTATE reported by the server (may be empty)
     */
    [[nodiscard]] const std::string& getSqlState() const noexcept {
        return sqlState_;
    }
};

/**
 * @brief Base class for integrity constraint violations
 *
 * Carries the name of the violated constraint (or unique index) so callers
 * can tell which invariant was hit.
 */
class ConstraintViolationException : public DatabaseException {
private:
    std::string constraint_;

public:
    ConstraintViolationException(const std::string& message,
                                 std::string sqlState,
                                 std::string constraint)
        : DatabaseException(message, std::move(sqlState)),
          constraint_(std::move(constraint)) {}

    [[nodiscard]] const std::string& getConstraint() const noexcept {
        return constraint_;
    }
};

/**
 * @brief Unique constraint violated (SQLSTATE 23505)
 */
class UniqueViolationException : public ConstraintViolationException {
public:
    UniqueViolationException(const std::string& message, std::string constraint)
        : ConstraintViolationException(message, "23505", std::move(constraint)) {}
};

/**
 * @brief Foreign key constraint violated (SQLSTATE 23503)
 */
class ForeignKeyViolationException : public ConstraintViolationException {
public:
    ForeignKeyViolationException(const std::string& message, std::string constraint)
        : ConstraintViolationException(message, "23503", std::move(constraint)) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public FileHubException {
public:
    explicit ConfigException(const std::string& message)
        : FileHubException("Configuration error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public FileHubException {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : FileHubException(poolType + " connection pool exhausted") {}
};

} // namespace common
