/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace iot::common {

// Static members
std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    // Load configuration from environment on construction
    loadFromEnvironment();
    spdlog::debug("ConfigManager initialized");
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    // Try environment variable
    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    // Convert to lowercase for comparison
    std::string lowerValue = value;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.find(key) != config_.end() || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    static const char* const keys[] = {
        LOG_LEVEL, LOG_TO_FILE, LOG_FILE,
        METADATA_MAX_BYTES, METADATA_MAX_DEPTH,
    };

    for (const char* key : keys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }

    spdlog::debug("Configuration loaded from environment");
}

} // namespace iot::common
