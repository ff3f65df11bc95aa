/**
 * @file asset.h
 * @brief Asset record
 */

#pragma once

#include "entity_row.h"
#include "metadata_entity.h"
#include <string>

namespace iot::entity {

/**
 * @brief Asset entity (building, vehicle, production line, ...)
 *
 * Columns: name (required), type, label. Description lives in metadata.
 */
class Asset : public MetadataEntity<AssetTag> {
private:
    std::string name_;
    std::string type_;
    std::string label_;

    static void validateName(const std::string& name);

public:
    static constexpr const char* DEFAULT_TYPE = "default";

    /**
     * @throws std::invalid_argument if name is empty
     */
    Asset(AssetId id, std::string name, std::string type = DEFAULT_TYPE,
          Timestamp createdTime = kUnsetTime);

    static Asset create(std::string name, std::string type = DEFAULT_TYPE);

    /**
     * @throws DomainMismatchError if the row is not an ASSET row
     */
    static Asset fromRow(const EntityRow& row);

    [[nodiscard]] EntityRow toRow() const;

    [[nodiscard]] const std::string& getName() const noexcept { return name_; }
    [[nodiscard]] const std::string& getType() const noexcept { return type_; }
    [[nodiscard]] const std::string& getLabel() const noexcept { return label_; }

    void setName(std::string name);
    void setType(std::string type) { type_ = std::move(type); }
    void setLabel(std::string label) { label_ = std::move(label); }

    [[nodiscard]] std::string getDescription() const;
    void setDescription(const std::string& description);
};

} // namespace iot::entity
