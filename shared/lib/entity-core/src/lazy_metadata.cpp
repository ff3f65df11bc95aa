/**
 * @file lazy_metadata.cpp
 * @brief Four-state metadata cache implementation
 */

#include "iot/entity/lazy_metadata.h"
#include "iot/entity/exceptions.h"

#include <stdexcept>
#include <utility>

namespace iot::entity {

LazyMetadata::LazyMetadata()
    : codec_(&MetadataCodec::defaultCodec()) {}

LazyMetadata::LazyMetadata(const MetadataCodec& codec)
    : codec_(&codec) {}

LazyMetadata::LazyMetadata(const LazyMetadata& other) noexcept
    : encoded_(std::atomic_load(&other.encoded_)),
      parsed_(std::atomic_load(&other.parsed_)),
      codec_(other.codec_) {}

LazyMetadata::LazyMetadata(LazyMetadata&& other) noexcept
    : encoded_(std::atomic_exchange(&other.encoded_, std::shared_ptr<const std::string>())),
      parsed_(std::atomic_exchange(&other.parsed_, std::shared_ptr<const Json::Value>())),
      codec_(other.codec_) {}

LazyMetadata& LazyMetadata::operator=(const LazyMetadata& other) noexcept {
    if (this != &other) {
        std::atomic_store(&encoded_, std::atomic_load(&other.encoded_));
        std::atomic_store(&parsed_, std::atomic_load(&other.parsed_));
        codec_ = other.codec_;
    }
    return *this;
}

LazyMetadata& LazyMetadata::operator=(LazyMetadata&& other) noexcept {
    if (this != &other) {
        std::atomic_store(&encoded_,
            std::atomic_exchange(&other.encoded_, std::shared_ptr<const std::string>()));
        std::atomic_store(&parsed_,
            std::atomic_exchange(&other.parsed_, std::shared_ptr<const Json::Value>()));
        codec_ = other.codec_;
    }
    return *this;
}

MetadataState LazyMetadata::state() const noexcept {
    bool hasEncoded = static_cast<bool>(std::atomic_load(&encoded_));
    bool hasParsed = static_cast<bool>(std::atomic_load(&parsed_));

    if (hasEncoded && hasParsed) return MetadataState::BOTH;
    if (hasEncoded) return MetadataState::ENCODED_ONLY;
    if (hasParsed) return MetadataState::PARSED_ONLY;
    return MetadataState::EMPTY;
}

const Json::Value& LazyMetadata::get() const {
    auto parsed = std::atomic_load(&parsed_);
    if (parsed) {
        return *parsed;
    }

    auto encoded = std::atomic_load(&encoded_);
    if (!encoded) {
        return MetadataCodec::emptyDocument();
    }

    // Compute locally, then publish; a concurrent reader may have won the race
    auto decoded = std::make_shared<const Json::Value>(codec_->decode(*encoded));
    std::shared_ptr<const Json::Value> expected;
    if (std::atomic_compare_exchange_strong(&parsed_, &expected, decoded)) {
        return *decoded;
    }
    return *expected;
}

void LazyMetadata::set(Json::Value document) {
    if (document.isNull()) {
        document = Json::Value(Json::objectValue);
    } else if (!document.isObject()) {
        throw std::invalid_argument("metadata must be a JSON object");
    }
    codec_->checkStorable(document);

    std::atomic_store(&parsed_, std::make_shared<const Json::Value>(std::move(document)));
    std::atomic_store(&encoded_, std::shared_ptr<const std::string>());
}

void LazyMetadata::setField(const std::string& key, Json::Value value) {
    Json::Value document = get();
    document[key] = std::move(value);
    set(std::move(document));
}

Json::Value LazyMetadata::getField(const std::string& key, const Json::Value& defaultValue) const {
    const Json::Value& document = get();
    if (!document.isMember(key)) {
        return defaultValue;
    }
    return document[key];
}

std::string LazyMetadata::encode() const {
    auto parsed = std::atomic_load(&parsed_);
    if (parsed) {
        return codec_->encode(*parsed);
    }

    auto encoded = std::atomic_load(&encoded_);
    if (encoded) {
        return *encoded;
    }
    return MetadataCodec::emptyEncoding();
}

void LazyMetadata::load(std::string bytes) {
    std::atomic_store(&encoded_, std::make_shared<const std::string>(std::move(bytes)));
    std::atomic_store(&parsed_, std::shared_ptr<const Json::Value>());
}

void LazyMetadata::clear() noexcept {
    std::atomic_store(&parsed_, std::shared_ptr<const Json::Value>());
    std::atomic_store(&encoded_, std::shared_ptr<const std::string>());
}

} // namespace iot::entity
