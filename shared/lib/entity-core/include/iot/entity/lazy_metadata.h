/**
 * @file lazy_metadata.h
 * @brief Dual byte/parsed metadata component with lazy synchronization
 *
 * Holds the encoded bytes as loaded from storage and/or the parsed
 * document, and moves between four states:
 *
 *   load()                 -> ENCODED_ONLY
 *   get() on ENCODED_ONLY  -> BOTH (decode, published once)
 *   set() from any state   -> PARSED_ONLY (bytes dropped, not re-encoded)
 *   clear()                -> EMPTY
 *
 * encode() never changes the state. Whenever both representations are
 * present they denote the same document.
 *
 * Readers may share an instance: the first decode after load() is
 * computed-then-published, a losing concurrent decode is discarded.
 * Mutators (set, setField, load, clear) need external serialization.
 */

#pragma once

#include "metadata_codec.h"
#include <memory>
#include <string>
#include <json/json.h>

namespace iot::entity {

/// @brief Representation state of a LazyMetadata
enum class MetadataState {
    EMPTY,          ///< Neither bytes nor document
    ENCODED_ONLY,   ///< Bytes loaded, not yet decoded
    PARSED_ONLY,    ///< Document set, bytes stale and dropped
    BOTH            ///< Bytes decoded, document cached
};

/// @brief Convert MetadataState to string
inline std::string metadataStateToString(MetadataState s) {
    switch (s) {
        case MetadataState::EMPTY:        return "EMPTY";
        case MetadataState::ENCODED_ONLY: return "ENCODED_ONLY";
        case MetadataState::PARSED_ONLY:  return "PARSED_ONLY";
        case MetadataState::BOTH:         return "BOTH";
    }
    return "UNKNOWN";
}

class LazyMetadata {
public:
    LazyMetadata();

    /**
     * @brief Use a specific codec
     * @param codec Codec (non-owning, must outlive this object)
     */
    explicit LazyMetadata(const MetadataCodec& codec);

    LazyMetadata(const LazyMetadata& other) noexcept;
    LazyMetadata(LazyMetadata&& other) noexcept;
    LazyMetadata& operator=(const LazyMetadata& other) noexcept;
    LazyMetadata& operator=(LazyMetadata&& other) noexcept;

    [[nodiscard]] MetadataState state() const noexcept;

    [[nodiscard]] bool isEmpty() const noexcept {
        return state() == MetadataState::EMPTY;
    }

    /**
     * @brief Parsed document, decoding the loaded bytes if needed
     *
     * Returns the empty document in the EMPTY state. The reference stays
     * valid until the next mutation of this object.
     *
     * @throws DecodeError if the loaded bytes are malformed
     */
    [[nodiscard]] const Json::Value& get() const;

    /**
     * @brief Replace the document; loaded bytes become stale and are dropped
     * @throws std::invalid_argument if @p document is neither an object nor
     *         null, or if its encoding could not be decoded again
     */
    void set(Json::Value document);

    /**
     * @brief Set one top-level member (get, copy, modify, set)
     * @throws DecodeError if the loaded bytes are malformed
     * @throws std::invalid_argument if the result is rejected by set()
     */
    void setField(const std::string& key, Json::Value value);

    /**
     * @brief One top-level member, or @p defaultValue if absent
     * @throws DecodeError if the loaded bytes are malformed
     */
    [[nodiscard]] Json::Value getField(const std::string& key,
                                       const Json::Value& defaultValue = Json::Value()) const;

    /**
     * @brief Persisted form of the metadata
     *
     * Encodes the cached document if there is one, otherwise returns the
     * loaded bytes unchanged, otherwise "{}". Does not cache the result.
     */
    [[nodiscard]] std::string encode() const;

    /**
     * @brief Hydrate from storage; never decodes, never throws on bad bytes
     */
    void load(std::string bytes);

    void clear() noexcept;

private:
    std::shared_ptr<const std::string> encoded_;
    mutable std::shared_ptr<const Json::Value> parsed_;
    const MetadataCodec* codec_;
};

} // namespace iot::entity
