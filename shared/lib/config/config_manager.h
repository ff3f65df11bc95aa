/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment-supplied settings.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace iot::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Explicitly set values take precedence over the process environment.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    // Singleton instance
    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    // Delete copy and move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparsable values fall back to @p defaultValue with a warning.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (any case).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value (environment still applies)
     */
    void unset(const std::string& key);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    // Metadata codec
    static constexpr const char* METADATA_MAX_BYTES = "METADATA_MAX_BYTES";
    static constexpr const char* METADATA_MAX_DEPTH = "METADATA_MAX_DEPTH";
};

} // namespace iot::common
