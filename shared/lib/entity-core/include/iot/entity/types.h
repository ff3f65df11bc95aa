/**
 * @file types.h
 * @brief Common types for the entity core
 *
 * Entity domains, their compile-time tags and the timestamp type shared by
 * every persisted record.
 */

#pragma once

#include <cstdint>
#include <string>

namespace iot::entity {

/// @brief Milliseconds since Unix epoch; 0 means "not yet assigned"
using Timestamp = std::int64_t;

/// @brief Sentinel createdTime of an entity that was never persisted
inline constexpr Timestamp kUnsetTime = 0;

/// @brief Entity domains (one per identifier space)
enum class EntityType {
    TENANT,
    CUSTOMER,
    USER,
    DEVICE,
    ASSET,
    DASHBOARD
};

/// @brief Convert EntityType to string
inline std::string entityTypeToString(EntityType t) {
    switch (t) {
        case EntityType::TENANT:    return "TENANT";
        case EntityType::CUSTOMER:  return "CUSTOMER";
        case EntityType::USER:      return "USER";
        case EntityType::DEVICE:    return "DEVICE";
        case EntityType::ASSET:     return "ASSET";
        case EntityType::DASHBOARD: return "DASHBOARD";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse EntityType from its string form (case-sensitive)
 * @throws ConstructionError for an unknown name
 */
EntityType parseEntityType(const std::string& name);

// --- Domain tags ---
//
// Each tag names its EntityType and whether the nil UUID is an acceptable
// identifier value ("unassigned" placeholders used by builders).

struct TenantTag {
    static constexpr EntityType kType = EntityType::TENANT;
    static constexpr bool kAllowsNil = true;
};

struct CustomerTag {
    static constexpr EntityType kType = EntityType::CUSTOMER;
    static constexpr bool kAllowsNil = true;
};

struct UserTag {
    static constexpr EntityType kType = EntityType::USER;
    static constexpr bool kAllowsNil = false;
};

struct DeviceTag {
    static constexpr EntityType kType = EntityType::DEVICE;
    static constexpr bool kAllowsNil = true;
};

struct AssetTag {
    static constexpr EntityType kType = EntityType::ASSET;
    static constexpr bool kAllowsNil = true;
};

struct DashboardTag {
    static constexpr EntityType kType = EntityType::DASHBOARD;
    static constexpr bool kAllowsNil = true;
};

} // namespace iot::entity
