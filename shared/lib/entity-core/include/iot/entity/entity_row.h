/**
 * @file entity_row.h
 * @brief Persisted row shape and the storage-side mapping of entities
 *
 * The core does not talk to a database. These helpers fix the contract a
 * storage layer follows: bytes are loaded without decoding on read, the
 * metadata is encoded immediately before a write, and createdTime is only
 * stamped while still unset.
 */

#pragma once

#include "entity.h"
#include "exceptions.h"
#include "metadata_entity.h"
#include "types.h"
#include "uuid.h"
#include <map>
#include <optional>
#include <string>

namespace iot::entity {

/// @brief One stored record
struct EntityRow {
    Uuid::Bytes id{};                           ///< 16-byte identifier
    EntityType type = EntityType::TENANT;       ///< Domain discriminator (table/column)
    Timestamp createdTime = kUnsetTime;         ///< created_time column
    std::optional<std::string> metadata;        ///< NULL when no metadata was ever stored
    std::map<std::string, std::string> columns; ///< Domain-specific columns
};

/**
 * @brief Assign createdTime if the entity has none yet
 * @return true if the timestamp was stamped
 */
template<typename Tag>
bool stampCreatedTime(Entity<Tag>& entity, Timestamp now) {
    if (entity.hasCreatedTime()) {
        return false;
    }
    entity.setCreatedTime(now);
    return true;
}

/**
 * @brief Common columns of a metadata entity, metadata encoded for writing
 */
template<typename Tag>
EntityRow toRow(const MetadataEntity<Tag>& entity) {
    EntityRow row;
    row.id = entity.getId().getId().bytes();
    row.type = Tag::kType;
    row.createdTime = entity.getCreatedTime();
    row.metadata = entity.encodeMetadata();
    return row;
}

/**
 * @brief Check that a row belongs to domain @p Tag
 * @throws DomainMismatchError otherwise
 */
template<typename Tag>
void requireRowType(const EntityRow& row) {
    if (row.type != Tag::kType) {
        throw DomainMismatchError(entityTypeToString(Tag::kType), entityTypeToString(row.type));
    }
}

/**
 * @brief Hydrate a metadata entity from a row; metadata is not decoded here
 * @throws DomainMismatchError if the row belongs to another domain
 * @throws ConstructionError if the id or createdTime is invalid for the domain
 */
template<typename Tag>
MetadataEntity<Tag> fromRow(const EntityRow& row) {
    requireRowType<Tag>(row);

    MetadataEntity<Tag> entity(EntityId<Tag>::from(Uuid(row.id)), row.createdTime);
    if (row.metadata) {
        entity.loadMetadataBytes(*row.metadata);
    }
    return entity;
}

/**
 * @brief Domain column value, or @p defaultValue when the column is absent
 */
inline std::string columnOr(const EntityRow& row, const std::string& column,
                            const std::string& defaultValue = std::string()) {
    auto it = row.columns.find(column);
    return it == row.columns.end() ? defaultValue : it->second;
}

} // namespace iot::entity
