/**
 * @file types.cpp
 * @brief EntityType parsing
 */

#include "iot/entity/types.h"
#include "iot/entity/exceptions.h"

namespace iot::entity {

EntityType parseEntityType(const std::string& name) {
    if (name == "TENANT")    return EntityType::TENANT;
    if (name == "CUSTOMER")  return EntityType::CUSTOMER;
    if (name == "USER")      return EntityType::USER;
    if (name == "DEVICE")    return EntityType::DEVICE;
    if (name == "ASSET")     return EntityType::ASSET;
    if (name == "DASHBOARD") return EntityType::DASHBOARD;

    throw ConstructionError("Unknown entity type: " + name, "INVALID_ENTITY_TYPE");
}

} // namespace iot::entity
