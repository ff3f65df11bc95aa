/**
 * @file entity_id.h
 * @brief Domain-tagged entity identifier
 */

#pragma once

#include "exceptions.h"
#include "types.h"
#include "uuid.h"
#include <atomic>
#include <cstddef>
#include <string>

namespace iot::entity {

/**
 * @brief Typed identifier of an entity in domain @p Tag
 *
 * Identifiers of different domains are distinct types: comparing a
 * DeviceId with an AssetId does not compile, even when both wrap the same
 * UUID. The value never changes after construction.
 *
 * The hash is memoized on first use. Concurrent first readers may each
 * compute it; the first to publish wins and the others adopt its result.
 *
 * @tparam Tag Domain tag providing kType and kAllowsNil
 */
template<typename Tag>
class EntityId {
private:
    Uuid uuid_;
    mutable std::atomic<std::size_t> hash_{0};  // 0 = not yet computed

    explicit EntityId(Uuid uuid) : uuid_(std::move(uuid)) {}

    static std::size_t computeHash(const Uuid& uuid) noexcept {
        std::size_t h = uuid.hash();
        return h == 0 ? 1 : h;
    }

public:
    using tag_type = Tag;

    /**
     * @brief Generate a new unique identifier in this domain
     */
    static EntityId create() {
        return EntityId(Uuid::random());
    }

    /**
     * @brief Wrap an existing UUID under this domain
     * @throws ConstructionError if @p uuid is nil and the domain forbids nil
     */
    static EntityId from(const Uuid& uuid) {
        if (uuid.isNil() && !Tag::kAllowsNil) {
            throw ConstructionError(
                "nil identifier is not allowed for domain " + entityTypeToString(Tag::kType));
        }
        return EntityId(uuid);
    }

    /**
     * @brief Wrap a UUID given in canonical text form
     * @throws ConstructionError if the text is not a UUID, or nil is forbidden
     */
    static EntityId from(const std::string& text) {
        auto uuid = Uuid::parse(text);
        if (!uuid) {
            throw ConstructionError(
                entityTypeToString(Tag::kType) + " identifier must be a valid UUID: " + text);
        }
        return from(*uuid);
    }

    EntityId(const EntityId& other) noexcept
        : uuid_(other.uuid_),
          hash_(other.hash_.load(std::memory_order_relaxed)) {}

    EntityId(EntityId&& other) noexcept
        : uuid_(other.uuid_),
          hash_(other.hash_.load(std::memory_order_relaxed)) {}

    EntityId& operator=(const EntityId&) = delete;
    EntityId& operator=(EntityId&&) = delete;

    [[nodiscard]] const Uuid& getId() const noexcept {
        return uuid_;
    }

    [[nodiscard]] static constexpr EntityType entityType() noexcept {
        return Tag::kType;
    }

    [[nodiscard]] bool isNil() const noexcept {
        return uuid_.isNil();
    }

    [[nodiscard]] std::string toString() const {
        return uuid_.toString();
    }

    /**
     * @brief Memoized hash of the identifier value
     */
    [[nodiscard]] std::size_t hashCode() const noexcept {
        std::size_t cached = hash_.load(std::memory_order_acquire);
        if (cached != 0) {
            return cached;
        }

        std::size_t computed = computeHash(uuid_);
        std::size_t expected = 0;
        if (hash_.compare_exchange_strong(expected, computed, std::memory_order_acq_rel)) {
            return computed;
        }
        return expected;
    }

    bool operator==(const EntityId& other) const noexcept {
        return uuid_ == other.uuid_;
    }

    bool operator!=(const EntityId& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const EntityId& other) const noexcept {
        return uuid_ < other.uuid_;
    }
};

using TenantId = EntityId<TenantTag>;
using CustomerId = EntityId<CustomerTag>;
using UserId = EntityId<UserTag>;
using DeviceId = EntityId<DeviceTag>;
using AssetId = EntityId<AssetTag>;
using DashboardId = EntityId<DashboardTag>;

} // namespace iot::entity

// Hash specialization for EntityId
namespace std {
    template<typename Tag>
    struct hash<iot::entity::EntityId<Tag>> {
        size_t operator()(const iot::entity::EntityId<Tag>& id) const noexcept {
            return id.hashCode();
        }
    };
}
