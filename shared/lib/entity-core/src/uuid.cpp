/**
 * @file uuid.cpp
 * @brief libuuid-backed UUID operations
 */

#include "iot/entity/uuid.h"

#include <cstring>
#include <uuid/uuid.h>

namespace iot::entity {

Uuid Uuid::random() {
    uuid_t raw;
    uuid_generate_random(raw);

    Bytes bytes;
    std::memcpy(bytes.data(), raw, BYTE_SIZE);
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(const std::string& text) {
    // uuid_parse only checks the hyphen positions and hex digits of the first 36 chars
    if (text.length() != 36) {
        return std::nullopt;
    }

    uuid_t raw;
    if (uuid_parse(text.c_str(), raw) != 0) {
        return std::nullopt;
    }

    Bytes bytes;
    std::memcpy(bytes.data(), raw, BYTE_SIZE);
    return Uuid(bytes);
}

bool Uuid::isNil() const noexcept {
    for (auto b : value_) {
        if (b != 0) return false;
    }
    return true;
}

std::string Uuid::toString() const {
    uuid_t raw;
    std::memcpy(raw, value_.data(), BYTE_SIZE);

    char str[37];
    uuid_unparse_lower(raw, str);
    return std::string(str);
}

std::size_t Uuid::hash() const noexcept {
    // FNV-1a over the raw bytes
    std::uint64_t h = 0xcbf29ce484222325ULL;
    for (auto b : value_) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return static_cast<std::size_t>(h);
}

} // namespace iot::entity
