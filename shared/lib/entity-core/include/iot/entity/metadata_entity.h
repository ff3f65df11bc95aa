/**
 * @file metadata_entity.h
 * @brief Entity carrying a lazily decoded JSON metadata document
 */

#pragma once

#include "entity.h"
#include "lazy_metadata.h"
#include <string>
#include <json/json.h>

namespace iot::entity {

/**
 * @brief Entity with attached metadata
 *
 * Storage hydrates it with loadMetadataBytes() and reads encodeMetadata()
 * right before a write. Metadata never takes part in identity.
 *
 * @tparam Tag Domain tag of the entity's identifier
 */
template<typename Tag>
class MetadataEntity : public Entity<Tag> {
private:
    LazyMetadata metadata_;

public:
    explicit MetadataEntity(EntityId<Tag> id, Timestamp createdTime = kUnsetTime)
        : Entity<Tag>(std::move(id), createdTime) {}

    MetadataEntity(EntityId<Tag> id, Timestamp createdTime, const MetadataCodec& codec)
        : Entity<Tag>(std::move(id), createdTime),
          metadata_(codec) {}

    MetadataEntity(MetadataEntity&&) noexcept = default;

    /**
     * @brief Parsed metadata; decodes loaded bytes on first call
     * @throws DecodeError if the loaded bytes are malformed
     */
    [[nodiscard]] const Json::Value& getMetadata() const {
        return metadata_.get();
    }

    void setMetadata(Json::Value metadata) {
        metadata_.set(std::move(metadata));
    }

    void setMetadataField(const std::string& key, Json::Value value) {
        metadata_.setField(key, std::move(value));
    }

    [[nodiscard]] Json::Value getMetadataField(const std::string& key,
                                               const Json::Value& defaultValue = Json::Value()) const {
        return metadata_.getField(key, defaultValue);
    }

    [[nodiscard]] std::string encodeMetadata() const {
        return metadata_.encode();
    }

    void loadMetadataBytes(std::string bytes) {
        metadata_.load(std::move(bytes));
    }

    void clearMetadata() noexcept {
        metadata_.clear();
    }

    [[nodiscard]] MetadataState metadataState() const noexcept {
        return metadata_.state();
    }

    [[nodiscard]] bool hasMetadata() const noexcept {
        return !metadata_.isEmpty();
    }
};

} // namespace iot::entity
