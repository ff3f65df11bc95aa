/**
 * @file exceptions.h
 * @brief Exception hierarchy for the entity core
 *
 * Every error raised by the identity and metadata layer derives from
 * DomainException, so callers can catch the whole family at once or
 * branch on getCode().
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace iot::entity {

/**
 * @brief Base exception for entity domain errors
 *
 * Used when a domain invariant (identity, domain tag, metadata encoding)
 * is violated.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "DOMAIN_MISMATCH")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    /**
     * @brief Get the error message
     */
    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief Invalid identifier or entity state supplied at construction
 */
class ConstructionError : public DomainException {
public:
    explicit ConstructionError(const std::string& message,
                               std::string code = "INVALID_IDENTIFIER")
        : DomainException(std::move(code), "Construction error: " + message) {}
};

/**
 * @brief Malformed metadata bytes met at lazy-parse time
 */
class DecodeError : public DomainException {
public:
    explicit DecodeError(const std::string& message)
        : DomainException("METADATA_DECODE_FAILED", "Metadata decode error: " + message) {}
};

/**
 * @brief Identifier domain does not match the expected domain
 */
class DomainMismatchError : public DomainException {
public:
    DomainMismatchError(const std::string& expected, const std::string& actual)
        : DomainException("DOMAIN_MISMATCH",
                          "Domain mismatch: expected " + expected + ", got " + actual) {}
};

} // namespace iot::entity
