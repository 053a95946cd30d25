/**
 * @file Entity.hpp
 * @brief Base class for Entities in DDD
 */

#pragma once

#include <chrono>

namespace shared::domain {

/**
 * @brief Base template class for Entities
 *
 * Entities are defined by their identity, not by their attributes. Two
 * entities with the same ID are the same entity even if one of them is a
 * stale snapshot of the stored row.
 *
 * Instances are plain snapshots of persisted rows, so they may be copied.
 * The creation timestamp is immutable once set.
 *
 * @tparam IdType The type of the entity's identifier
 */
template<typename IdType>
class Entity {
protected:
    IdType id_;
    std::chrono::system_clock::time_point createdAt_;

    /**
     * @brief Construct a new Entity created now
     */
    explicit Entity(IdType id)
        : id_(std::move(id)),
          createdAt_(std::chrono::system_clock::now()) {}

    /**
     * @brief Construct an Entity restored from persistence
     */
    Entity(IdType id, std::chrono::system_clock::time_point createdAt)
        : id_(std::move(id)),
          createdAt_(createdAt) {}

public:
    virtual ~Entity() = default;

    Entity(const Entity&) = default;
    Entity& operator=(const Entity&) = default;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) noexcept = default;

    [[nodiscard]] const IdType& getId() const noexcept {
        return id_;
    }

    [[nodiscard]] std::chrono::system_clock::time_point getCreatedAt() const noexcept {
        return createdAt_;
    }

    /**
     * @brief Equality comparison based on ID
     */
    bool operator==(const Entity& other) const {
        return id_ == other.id_;
    }

    bool operator!=(const Entity& other) const {
        return !(*this == other);
    }
};

} // namespace shared::domain
