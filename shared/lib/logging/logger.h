/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with standardized configuration so every component using
 * the entity core logs through the same default logger.
 */

#pragma once

#include "config_manager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <string>
#include <memory>
#include <vector>

namespace iot::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to an spdlog level
     *
     * Unknown names map to info.
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param name Logger name (e.g., "device-registry")
     * @param logLevel Log level (trace, debug, info, warn, error, critical, off)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // File sink (if enabled)
            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            // Set as default logger
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: name={}, level={}, file={}",
                         name, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Initialize from LOG_LEVEL, LOG_TO_FILE and LOG_FILE
     */
    static void initializeFromConfig(const std::string& name) {
        auto& config = ConfigManager::getInstance();
        initialize(name,
                   config.getString(ConfigManager::LOG_LEVEL, "info"),
                   config.getBool(ConfigManager::LOG_TO_FILE, false),
                   config.getString(ConfigManager::LOG_FILE, ""));
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush all loggers
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace iot::common
