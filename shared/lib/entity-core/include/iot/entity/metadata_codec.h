/**
 * @file metadata_codec.h
 * @brief JSON codec for entity metadata
 *
 * Encoding is compact JSON with ordered keys, so equal documents always
 * produce equal bytes. Decoding is strict (no comments, no trailing data,
 * no duplicate keys) and requires an object at the root; unknown members
 * are kept as-is.
 */

#pragma once

#include <cstddef>
#include <string>
#include <json/json.h>

namespace iot::entity {

class MetadataCodec {
public:
    struct Options {
        std::size_t maxBytes = 0;   ///< Largest accepted encoding, 0 = unlimited
        int maxDepth = 256;         ///< Nesting limit of a decoded document
    };

    MetadataCodec() = default;
    explicit MetadataCodec(Options options);

    /**
     * @brief Process-wide codec configured from ConfigManager
     *
     * Reads METADATA_MAX_BYTES and METADATA_MAX_DEPTH on first use.
     */
    static const MetadataCodec& defaultCodec();

    static Options optionsFromConfig();

    /**
     * @brief Decode metadata bytes
     *
     * An empty byte sequence decodes to the empty document.
     *
     * @throws DecodeError on malformed JSON, a non-object root, or a
     *         size/depth limit violation
     */
    [[nodiscard]] Json::Value decode(const std::string& bytes) const;

    /**
     * @brief Check that @p document survives encode() followed by decode()
     *
     * Rejects documents nested deeper than maxDepth, non-finite numbers
     * (written as 1e+9999 or null) and encodings larger than maxBytes.
     *
     * @throws std::invalid_argument if the document could not be read back
     */
    void checkStorable(const Json::Value& document) const;

    /**
     * @brief Canonical (compact, key-ordered) encoding of @p document
     */
    [[nodiscard]] std::string encode(const Json::Value& document) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

    /// @brief The "no metadata" document: {}
    static const Json::Value& emptyDocument();

    /// @brief Encoding of emptyDocument(): "{}"
    static const std::string& emptyEncoding();

private:
    Options options_;
};

} // namespace iot::entity
