/**
 * @file device.cpp
 * @brief Device record implementation
 */

#include "iot/entity/device.h"

#include <stdexcept>

namespace iot::entity {

namespace {
constexpr const char* kGatewayField = "gateway";
constexpr const char* kDescriptionField = "description";
}

Device::Device(DeviceId id, std::string name, std::string type, Timestamp createdTime)
    : MetadataEntity<DeviceTag>(std::move(id), createdTime),
      name_(std::move(name)),
      type_(std::move(type))
{
    validateName(name_);
}

void Device::validateName(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Device name cannot be empty");
    }
}

Device Device::create(std::string name, std::string type) {
    return Device(DeviceId::create(), std::move(name), std::move(type));
}

Device Device::fromRow(const EntityRow& row) {
    requireRowType<DeviceTag>(row);

    Device device(DeviceId::from(Uuid(row.id)),
                  columnOr(row, "name"),
                  columnOr(row, "type", DEFAULT_TYPE),
                  row.createdTime);
    device.label_ = columnOr(row, "label");
    if (row.metadata) {
        device.loadMetadataBytes(*row.metadata);
    }
    return device;
}

EntityRow Device::toRow() const {
    EntityRow row = iot::entity::toRow<DeviceTag>(*this);
    row.columns["name"] = name_;
    row.columns["type"] = type_;
    row.columns["label"] = label_;
    return row;
}

void Device::setName(std::string name) {
    validateName(name);
    name_ = std::move(name);
}

bool Device::isGateway() const {
    Json::Value gateway = getMetadataField(kGatewayField, false);
    return gateway.isBool() && gateway.asBool();
}

void Device::setGateway(bool gateway) {
    setMetadataField(kGatewayField, gateway);
}

std::string Device::getDescription() const {
    Json::Value description = getMetadataField(kDescriptionField);
    return description.isString() ? description.asString() : std::string();
}

void Device::setDescription(const std::string& description) {
    setMetadataField(kDescriptionField, description);
}

} // namespace iot::entity
