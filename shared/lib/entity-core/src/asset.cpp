/**
 * @file asset.cpp
 * @brief Asset record implementation
 */

#include "iot/entity/asset.h"

#include <stdexcept>

namespace iot::entity {

Asset::Asset(AssetId id, std::string name, std::string type, Timestamp createdTime)
    : MetadataEntity<AssetTag>(std::move(id), createdTime),
      name_(std::move(name)),
      type_(std::move(type))
{
    validateName(name_);
}

void Asset::validateName(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Asset name cannot be empty");
    }
}

Asset Asset::create(std::string name, std::string type) {
    return Asset(AssetId::create(), std::move(name), std::move(type));
}

Asset Asset::fromRow(const EntityRow& row) {
    requireRowType<AssetTag>(row);

    Asset asset(AssetId::from(Uuid(row.id)),
                columnOr(row, "name"),
                columnOr(row, "type", DEFAULT_TYPE),
                row.createdTime);
    asset.label_ = columnOr(row, "label");
    if (row.metadata) {
        asset.loadMetadataBytes(*row.metadata);
    }
    return asset;
}

EntityRow Asset::toRow() const {
    EntityRow row = iot::entity::toRow<AssetTag>(*this);
    row.columns["name"] = name_;
    row.columns["type"] = type_;
    row.columns["label"] = label_;
    return row;
}

void Asset::setName(std::string name) {
    validateName(name);
    name_ = std::move(name);
}

std::string Asset::getDescription() const {
    Json::Value description = getMetadataField("description");
    return description.isString() ? description.asString() : std::string();
}

void Asset::setDescription(const std::string& description) {
    setMetadataField("description", description);
}

} // namespace iot::entity
