/**
 * @file entity_identifier.h
 * @brief Runtime (type, uuid) identifier for domain-agnostic code paths
 *
 * Used where the domain is carried as data: a discriminator column, a
 * JSON payload from transport. Turning it back into a typed EntityId is an
 * explicit, checked operation.
 */

#pragma once

#include "entity_id.h"
#include "exceptions.h"
#include "types.h"
#include "uuid.h"
#include <json/json.h>
#include <string>

namespace iot::entity {

class EntityIdentifier {
private:
    EntityType type_;
    Uuid uuid_;

public:
    EntityIdentifier(EntityType type, Uuid uuid)
        : type_(type), uuid_(std::move(uuid)) {}

    template<typename Tag>
    static EntityIdentifier of(const EntityId<Tag>& id) {
        return EntityIdentifier(Tag::kType, id.getId());
    }

    /**
     * @brief Build from a type name and UUID text (e.g. "DEVICE", "1e...")
     * @throws ConstructionError for an unknown type or malformed UUID
     */
    static EntityIdentifier parse(const std::string& typeName, const std::string& uuidText);

    /**
     * @brief Build from {"entityType": "...", "id": "..."}
     * @throws ConstructionError if a member is missing or invalid
     */
    static EntityIdentifier fromJson(const Json::Value& json);

    [[nodiscard]] EntityType getEntityType() const noexcept { return type_; }
    [[nodiscard]] const Uuid& getId() const noexcept { return uuid_; }

    /**
     * @brief Checked conversion to the typed identifier of domain @p Tag
     * @throws DomainMismatchError if this identifier belongs to another domain
     * @throws ConstructionError if the value is nil and @p Tag forbids nil
     */
    template<typename Tag>
    [[nodiscard]] EntityId<Tag> as() const {
        if (type_ != Tag::kType) {
            throw DomainMismatchError(entityTypeToString(Tag::kType), entityTypeToString(type_));
        }
        return EntityId<Tag>::from(uuid_);
    }

    template<typename Tag>
    [[nodiscard]] bool is() const noexcept {
        return type_ == Tag::kType;
    }

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @brief "TYPE:uuid", e.g. "DEVICE:11111111-1111-1111-1111-111111111111"
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const EntityIdentifier& other) const {
        return type_ == other.type_ && uuid_ == other.uuid_;
    }

    bool operator!=(const EntityIdentifier& other) const {
        return !(*this == other);
    }
};

} // namespace iot::entity

namespace std {
    template<>
    struct hash<iot::entity::EntityIdentifier> {
        size_t operator()(const iot::entity::EntityIdentifier& id) const noexcept {
            size_t h = id.getId().hash();
            return h ^ (static_cast<size_t>(id.getEntityType()) + 0x9e3779b9 + (h << 6) + (h >> 2));
        }
    };
}
