/**
 * @file Config.hpp
 * @brief Keep-alive and logging configuration loading
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * Reads monitor timings and logging settings from a JSON document:
 *
 * ```json
 * {
 *   "keepAlive": { "timeoutMs": 20000, "warningMs": 13333, "checkIntervalMs": 2222 },
 *   "logging":   { "level": "info", "file": "logs/vigil.log", "maxFileSizeMB": 10 }
 * }
 * ```
 *
 * Only keepAlive.timeoutMs is required. A missing warningMs or
 * checkIntervalMs is derived the same way as KeepAliveData::fromTimeout.
 */

#pragma once

#ifndef VIGIL_CORE_CONFIG_HPP
#define VIGIL_CORE_CONFIG_HPP

#include <Vigil/Core/Types.hpp>
#include <Vigil/Core/ErrorCodes.hpp>
#include <Vigil/Core/KeepAliveData.hpp>
#include <Vigil/Core/Logger.hpp>
#include <string>
#include <string_view>
#include <memory>

namespace Vigil::Config {

/**
 * @brief Logger settings from the "logging" object
 */
struct LoggingSettings {
    Core::LogLevel level = Core::LogLevel::Info;
    std::string file;               ///< Empty = console only
    size_t maxFileSizeMB = 10;
};

/**
 * @brief Parsed configuration document
 */
struct MonitorConfig {
    Network::KeepAliveData keepAlive;
    LoggingSettings logging;
};

/**
 * @brief JSON configuration loader
 */
class KeepAliveConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default

        /// Time used as the initial lastActivity; system clock when empty
        TimeSource time_source;
    };

    KeepAliveConfigLoader();
    explicit KeepAliveConfigLoader(const Options& options);
    ~KeepAliveConfigLoader();

    KeepAliveConfigLoader(const KeepAliveConfigLoader&) = delete;
    KeepAliveConfigLoader& operator=(const KeepAliveConfigLoader&) = delete;

    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration, or ConfigFileNotFound, FileTooLarge,
     *         FileReadError, or any error from loadFromString()
     */
    Result<MonitorConfig> load(const std::string& path);

    /**
     * @brief Load configuration from a JSON string
     * @return Parsed configuration, or JsonParseFailed, MissingField,
     *         InvalidFieldType, ConfigInvalid
     */
    Result<MonitorConfig> loadFromString(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Initialize the global logger from parsed settings
 * @return true if the logger was initialized by this call
 */
bool initializeLogging(const LoggingSettings& settings);

} // namespace Vigil::Config

#endif // VIGIL_CORE_CONFIG_HPP
