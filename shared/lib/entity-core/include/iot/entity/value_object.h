/**
 * @file value_object.h
 * @brief Base class for Value Objects
 */

#pragma once

#include <utility>

namespace iot::entity {

/**
 * @brief Base template class for Value Objects
 *
 * Value Objects are immutable objects that are defined by their attributes.
 * Two Value Objects with the same attributes are considered equal. They are
 * held by value; the base is never used polymorphically.
 *
 * @tparam T The type of the underlying value
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    explicit ValueObject(T value) : value_(std::move(value)) {}
    ~ValueObject() = default;

public:
    // Copyable and movable, never reassignable
    ValueObject(const ValueObject&) = default;
    ValueObject& operator=(const ValueObject&) = delete;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) = delete;

    bool operator==(const ValueObject& other) const {
        return value_ == other.value_;
    }

    bool operator!=(const ValueObject& other) const {
        return !(*this == other);
    }

    /**
     * @brief Less than comparison (for use in ordered containers)
     */
    bool operator<(const ValueObject& other) const {
        return value_ < other.value_;
    }
};

} // namespace iot::entity
