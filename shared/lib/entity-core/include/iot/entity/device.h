/**
 * @file device.h
 * @brief Device record
 */

#pragma once

#include "entity_row.h"
#include "metadata_entity.h"
#include <string>

namespace iot::entity {

/**
 * @brief Device entity
 *
 * Columns: name (required), type, label. The gateway flag and the free-form
 * description live in metadata.
 */
class Device : public MetadataEntity<DeviceTag> {
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
    Device(DeviceId id, std::string name, std::string type = DEFAULT_TYPE,
           Timestamp createdTime = kUnsetTime);

    /**
     * @brief New device with a freshly generated id
     */
    static Device create(std::string name, std::string type = DEFAULT_TYPE);

    /**
     * @brief Rebuild from storage; metadata stays encoded until first read
     * @throws DomainMismatchError if the row is not a DEVICE row
     */
    static Device fromRow(const EntityRow& row);

    [[nodiscard]] EntityRow toRow() const;

    [[nodiscard]] const std::string& getName() const noexcept { return name_; }
    [[nodiscard]] const std::string& getType() const noexcept { return type_; }
    [[nodiscard]] const std::string& getLabel() const noexcept { return label_; }

    void setName(std::string name);
    void setType(std::string type) { type_ = std::move(type); }
    void setLabel(std::string label) { label_ = std::move(label); }

    // Metadata-backed attributes

    [[nodiscard]] bool isGateway() const;
    void setGateway(bool gateway);

    [[nodiscard]] std::string getDescription() const;
    void setDescription(const std::string& description);
};

} // namespace iot::entity
