/**
 * @file uuid.h
 * @brief 128-bit unique value backing every entity identifier
 */

#pragma once

#include "value_object.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace iot::entity {

/**
 * @brief UUID Value Object (RFC 4122)
 *
 * Raw 16-byte value. Generation, parsing and formatting go through libuuid.
 * The default-constructed value is the nil UUID.
 */
class Uuid : public ValueObject<std::array<std::uint8_t, 16>> {
public:
    static constexpr std::size_t BYTE_SIZE = 16;
    using Bytes = std::array<std::uint8_t, BYTE_SIZE>;

    Uuid() : ValueObject<Bytes>(Bytes{}) {}
    explicit Uuid(const Bytes& bytes) : ValueObject<Bytes>(bytes) {}

    /**
     * @brief Generate a new random UUID (version 4)
     */
    static Uuid random();

    /**
     * @brief The nil UUID (all zero bytes)
     */
    static Uuid nil() { return Uuid(); }

    /**
     * @brief Parse canonical text (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
     * @return std::nullopt if the text is not a valid UUID
     */
    static std::optional<Uuid> parse(const std::string& text);

    [[nodiscard]] bool isNil() const noexcept;

    [[nodiscard]] const Bytes& bytes() const noexcept { return value_; }

    /**
     * @brief Lowercase hyphenated form
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Hash of the 16 bytes (deterministic across processes)
     */
    [[nodiscard]] std::size_t hash() const noexcept;
};

} // namespace iot::entity

namespace std {
    template<>
    struct hash<iot::entity::Uuid> {
        size_t operator()(const iot::entity::Uuid& uuid) const noexcept {
            return uuid.hash();
        }
    };
}
