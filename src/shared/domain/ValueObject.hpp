/**
 * @file ValueObject.hpp
 * @brief Base class for Value Objects in DDD
 */

#pragma once

#include <string>
#include <utility>

namespace shared::domain {

/**
 * @brief Immutable value compared by its underlying value
 *
 * Derived types validate in their own constructor and are created through
 * static factories, so an instance that exists is always valid.
 *
 * @tparam T The type of the underlying value
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}

public:
    [[nodiscard]] const T& getValue() const noexcept {
        return value_;
    }

    bool operator==(const ValueObject& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ValueObject& other) const {
        return !(*this == other);
    }

    bool operator<(const ValueObject& other) const {
        return value_ < other.value_;
    }
};

/**
 * @brief String-backed Value Object (identifiers, names, digests)
 */
class StringValueObject : public ValueObject<std::string> {
protected:
    explicit StringValueObject(std::string value)
        : ValueObject<std::string>(std::move(value)) {}

public:
    [[nodiscard]] bool isEmpty() const noexcept {
        return value_.empty();
    }
};

} // namespace shared::domain
