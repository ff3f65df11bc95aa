/**
 * @file metadata_codec.cpp
 * @brief jsoncpp-backed metadata encoding and decoding
 */

#include "iot/entity/metadata_codec.h"
#include "iot/entity/exceptions.h"
#include "config_manager.h"

#include <cmath>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace iot::entity {

namespace {

// Depth is counted the way the reader's stackLimit counts it: the root is 1
void checkValue(const Json::Value& value, int depth, int maxDepth) {
    if (depth > maxDepth) {
        throw std::invalid_argument("metadata nesting exceeds depth limit " + std::to_string(maxDepth));
    }

    switch (value.type()) {
        case Json::realValue:
            if (!std::isfinite(value.asDouble())) {
                throw std::invalid_argument("metadata contains a non-finite number");
            }
            break;
        case Json::arrayValue:
        case Json::objectValue:
            for (const auto& child : value) {
                checkValue(child, depth + 1, maxDepth);
            }
            break;
        default:
            break;
    }
}

} // namespace

MetadataCodec::MetadataCodec(Options options)
    : options_(options)
{
    if (options_.maxDepth <= 0) {
        throw std::invalid_argument("MetadataCodec: maxDepth must be positive");
    }
}

MetadataCodec::Options MetadataCodec::optionsFromConfig() {
    auto& config = iot::common::ConfigManager::getInstance();

    Options options;
    int maxBytes = config.getInt(iot::common::ConfigManager::METADATA_MAX_BYTES, 0);
    if (maxBytes < 0) {
        spdlog::warn("Ignoring negative {}: {}", iot::common::ConfigManager::METADATA_MAX_BYTES, maxBytes);
        maxBytes = 0;
    }
    options.maxBytes = static_cast<std::size_t>(maxBytes);

    int maxDepth = config.getInt(iot::common::ConfigManager::METADATA_MAX_DEPTH, options.maxDepth);
    if (maxDepth > 0) {
        options.maxDepth = maxDepth;
    } else {
        spdlog::warn("Ignoring non-positive {}: {}", iot::common::ConfigManager::METADATA_MAX_DEPTH, maxDepth);
    }
    return options;
}

const MetadataCodec& MetadataCodec::defaultCodec() {
    static std::unique_ptr<MetadataCodec> instance;
    static std::once_flag initFlag;

    std::call_once(initFlag, []() {
        Options options = optionsFromConfig();
        instance.reset(new MetadataCodec(options));
        spdlog::debug("Metadata codec initialized: maxBytes={}, maxDepth={}",
                      options.maxBytes, options.maxDepth);
    });
    return *instance;
}

Json::Value MetadataCodec::decode(const std::string& bytes) const {
    if (options_.maxBytes != 0 && bytes.size() > options_.maxBytes) {
        throw DecodeError("encoded size " + std::to_string(bytes.size()) +
                          " exceeds limit " + std::to_string(options_.maxBytes));
    }

    if (bytes.empty()) {
        return emptyDocument();
    }

    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["stackLimit"] = options_.maxDepth;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    bool parsed = false;

    try {
        parsed = reader->parse(bytes.data(), bytes.data() + bytes.size(), &root, &errs);
    } catch (const Json::Exception& e) {
        // stackLimit violations are reported by exception, not by return value
        spdlog::warn("Metadata decode aborted ({} bytes): {}", bytes.size(), e.what());
        throw DecodeError(e.what());
    }

    if (!parsed) {
        spdlog::warn("Metadata decode failed ({} bytes): {}", bytes.size(), errs);
        throw DecodeError(errs);
    }

    if (!root.isObject()) {
        spdlog::warn("Metadata decode failed: root is not a JSON object");
        throw DecodeError("metadata root must be a JSON object");
    }

    return root;
}

void MetadataCodec::checkStorable(const Json::Value& document) const {
    checkValue(document, 1, options_.maxDepth);

    if (options_.maxBytes != 0) {
        std::size_t size = encode(document).size();
        if (size > options_.maxBytes) {
            throw std::invalid_argument("encoded metadata size " + std::to_string(size) +
                                        " exceeds limit " + std::to_string(options_.maxBytes));
        }
    }
}

std::string MetadataCodec::encode(const Json::Value& document) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, document);
}

const Json::Value& MetadataCodec::emptyDocument() {
    static const Json::Value empty(Json::objectValue);
    return empty;
}

const std::string& MetadataCodec::emptyEncoding() {
    static const std::string empty = "{}";
    return empty;
}

} // namespace iot::entity
