/**
 * @file entity.h
 * @brief Identity + creation-time aggregate shared by all persisted records
 */

#pragma once

#include "entity_id.h"
#include "exceptions.h"
#include "types.h"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace iot::entity {

/**
 * @brief Base template class for Entities
 *
 * Entities are objects that are defined by their identity (ID),
 * not by their attributes. Two entities with the same ID are the same entity,
 * whatever their createdTime or other fields.
 *
 * @tparam Tag Domain tag of the entity's identifier
 */
template<typename Tag>
class Entity {
protected:
    const EntityId<Tag> id_;
    Timestamp createdTime_;

public:
    using id_type = EntityId<Tag>;

    /**
     * @brief Construct a new Entity with the given ID
     * @param id Identifier, fixed for the lifetime of the entity
     * @param createdTime Creation time in ms, kUnsetTime if not yet persisted
     * @throws ConstructionError if createdTime is negative
     */
    explicit Entity(EntityId<Tag> id, Timestamp createdTime = kUnsetTime)
        : id_(std::move(id)),
          createdTime_(createdTime) {
        if (createdTime_ < 0) {
            throw ConstructionError(
                "createdTime must be non-negative: " + std::to_string(createdTime_),
                "INVALID_ENTITY");
        }
    }

    virtual ~Entity() = default;

    // Entities should not be copied or reassigned, only moved
    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;
    Entity(Entity&&) noexcept = default;
    Entity& operator=(Entity&&) = delete;

    /**
     * @brief Get the entity's ID
     */
    [[nodiscard]] const EntityId<Tag>& getId() const noexcept {
        return id_;
    }

    [[nodiscard]] Timestamp getCreatedTime() const noexcept {
        return createdTime_;
    }

    [[nodiscard]] bool hasCreatedTime() const noexcept {
        return createdTime_ != kUnsetTime;
    }

    /**
     * @brief Set the creation timestamp
     *
     * Overwriting an already assigned time is permitted; it replaces the
     * recorded provenance.
     *
     * @throws std::invalid_argument if createdTime is negative
     */
    void setCreatedTime(Timestamp createdTime) {
        if (createdTime < 0) {
            throw std::invalid_argument("createdTime must be non-negative");
        }
        if (createdTime_ != kUnsetTime && createdTime_ != createdTime) {
            spdlog::debug("Overwriting createdTime of {} {}: {} -> {}",
                          entityTypeToString(Tag::kType), id_.toString(),
                          createdTime_, createdTime);
        }
        createdTime_ = createdTime;
    }

    [[nodiscard]] std::size_t hashCode() const noexcept {
        return id_.hashCode();
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

} // namespace iot::entity

namespace std {
    template<typename Tag>
    struct hash<iot::entity::Entity<Tag>> {
        size_t operator()(const iot::entity::Entity<Tag>& entity) const noexcept {
            return entity.hashCode();
        }
    };
}
