/**
 * @file Logger.hpp
 * @brief Logging infrastructure for Vigil diagnostics
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 *
 * Thread-safe logging system with multiple severity levels, file rotation,
 * and structured output for connection-health events.
 */

#pragma once

#ifndef VIGIL_CORE_LOGGER_HPP
#define VIGIL_CORE_LOGGER_HPP

#include <spdlog/common.h>
#include <string>
#include <string_view>
#include <mutex>
#include <memory>
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <functional>

namespace spdlog {
class logger;
}

namespace Vigil {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing, one line per tick
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Warning messages for potential issues
    Error = 4,      ///< Error messages for failures
    Critical = 5,   ///< Critical events requiring immediate attention
    Off = 255       ///< Disable all logging
};

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Output to console/stdout
    File = 1 << 1,      ///< Output to file
    Callback = 1 << 2,  ///< Call user-provided callback
    All = Console | File | Callback
};

// Bitwise operators for LogOutput
inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline LogOutput operator&(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Formatted log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 * "critical", "off")
 * @return true and sets @p level on success
 */
bool ParseLogLevel(std::string_view name, LogLevel& level);

/**
 * @brief Thread-safe logging system for Vigil
 *
 * Features:
 * - Multiple severity levels with filtering
 * - Thread-safe file and console output
 * - Automatic log file rotation
 * - User callback integration
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Shutdown the logger and flush all buffers
     */
    void Shutdown();

    /**
     * @brief Whether Initialize() has succeeded and Shutdown() not yet run
     */
    bool IsInitialized() const;

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages (requires LogOutput::Callback)
     */
    void SetCallback(LogCallback callback);

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, result));
        } else if (result > 0) {
            // Buffer too small, allocate larger buffer
            std::string largeBuffer(result + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, std::forward<Args>(args)...);
            largeBuffer.resize(result);
            Log(level, largeBuffer);
        }
    }

    /**
     * @brief Flush all buffers to disk
     */
    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static LogLevel FromSpdlogLevel(spdlog::level::level_enum level);

    // Configuration
    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024; // 10 MB default

    // State
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    // Invoked from the spdlog callback sink, outside mutex_
    mutable std::mutex callbackMutex_;
    LogCallback callback_;

    // Statistics
    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Vigil

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef VIGIL_DISABLE_LOGGING

#define VIGIL_LOG_TRACE(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define VIGIL_LOG_DEBUG(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define VIGIL_LOG_INFO(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define VIGIL_LOG_WARNING(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define VIGIL_LOG_ERROR(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define VIGIL_LOG_CRITICAL(msg) \
    ::Vigil::Core::Logger::Instance().Log(::Vigil::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define VIGIL_LOG_TRACE_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Trace, fmt, __VA_ARGS__)

#define VIGIL_LOG_DEBUG_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define VIGIL_LOG_INFO_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define VIGIL_LOG_WARNING_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define VIGIL_LOG_ERROR_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Error, fmt, __VA_ARGS__)

#define VIGIL_LOG_CRITICAL_F(fmt, ...) \
    ::Vigil::Core::Logger::Instance().LogFormat(::Vigil::Core::LogLevel::Critical, fmt, __VA_ARGS__)

#else
// Logging disabled - all macros are no-ops
#define VIGIL_LOG_TRACE(msg) ((void)0)
#define VIGIL_LOG_DEBUG(msg) ((void)0)
#define VIGIL_LOG_INFO(msg) ((void)0)
#define VIGIL_LOG_WARNING(msg) ((void)0)
#define VIGIL_LOG_ERROR(msg) ((void)0)
#define VIGIL_LOG_CRITICAL(msg) ((void)0)
#define VIGIL_LOG_TRACE_F(fmt, ...) ((void)0)
#define VIGIL_LOG_DEBUG_F(fmt, ...) ((void)0)
#define VIGIL_LOG_INFO_F(fmt, ...) ((void)0)
#define VIGIL_LOG_WARNING_F(fmt, ...) ((void)0)
#define VIGIL_LOG_ERROR_F(fmt, ...) ((void)0)
#define VIGIL_LOG_CRITICAL_F(fmt, ...) ((void)0)
#endif // VIGIL_DISABLE_LOGGING

#endif // VIGIL_CORE_LOGGER_HPP
