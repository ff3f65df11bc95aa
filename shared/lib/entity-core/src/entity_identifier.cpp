/**
 * @file entity_identifier.cpp
 * @brief Runtime identifier parsing and JSON form
 */

#include "iot/entity/entity_identifier.h"

namespace iot::entity {

EntityIdentifier EntityIdentifier::parse(const std::string& typeName, const std::string& uuidText) {
    EntityType type = parseEntityType(typeName);

    auto uuid = Uuid::parse(uuidText);
    if (!uuid) {
        throw ConstructionError(typeName + " identifier must be a valid UUID: " + uuidText);
    }
    return EntityIdentifier(type, *uuid);
}

EntityIdentifier EntityIdentifier::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ConstructionError("entity identifier JSON must be an object");
    }

    const Json::Value& type = json["entityType"];
    const Json::Value& id = json["id"];
    if (!type.isString() || !id.isString()) {
        throw ConstructionError("entity identifier JSON requires string 'entityType' and 'id'");
    }
    return parse(type.asString(), id.asString());
}

Json::Value EntityIdentifier::toJson() const {
    Json::Value json(Json::objectValue);
    json["entityType"] = entityTypeToString(type_);
    json["id"] = uuid_.toString();
    return json;
}

std::string EntityIdentifier::toString() const {
    return entityTypeToString(type_) + ":" + uuid_.toString();
}

} // namespace iot::entity
