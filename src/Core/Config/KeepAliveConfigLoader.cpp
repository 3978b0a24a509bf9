/**
 * @file KeepAliveConfigLoader.cpp
 * @brief JSON configuration loading for keep-alive timings and logging
 * @author Vigil Networking Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Networking. All rights reserved.
 */

#include <Vigil/Core/Config.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <optional>
#include <limits>

namespace Vigil::Config {

using json = nlohmann::json;

namespace {

/**
 * Read an optional millisecond field. Absent leaves @p out empty.
 */
ErrorCode readMilliseconds(const json& object, const char* key, std::optional<int64_t>& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        out.reset();
        return ErrorCode::Success;
    }
    if (!it->is_number_integer()) {
        return ErrorCode::InvalidFieldType;
    }
    if (it->is_number_unsigned() &&
        it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return ErrorCode::ConfigInvalid;
    }
    out = it->get<int64_t>();
    return ErrorCode::Success;
}

ErrorCode parseLogging(const json& object, LoggingSettings& settings) {
    if (!object.is_object()) {
        return ErrorCode::InvalidFieldType;
    }

    if (auto it = object.find("level"); it != object.end()) {
        if (!it->is_string()) {
            return ErrorCode::InvalidFieldType;
        }
        if (!Core::ParseLogLevel(it->get<std::string>(), settings.level)) {
            return ErrorCode::ConfigInvalid;
        }
    }

    if (auto it = object.find("file"); it != object.end()) {
        if (!it->is_string()) {
            return ErrorCode::InvalidFieldType;
        }
        settings.file = it->get<std::string>();
    }

    if (auto it = object.find("maxFileSizeMB"); it != object.end()) {
        if (!it->is_number_unsigned() || it->get<uint64_t>() == 0) {
            return ErrorCode::ConfigInvalid;
        }
        settings.maxFileSizeMB = static_cast<size_t>(it->get<uint64_t>());
    }

    return ErrorCode::Success;
}

} // namespace

// ============================================================================
// KeepAliveConfigLoader Implementation
// ============================================================================

class KeepAliveConfigLoader::Impl {
public:
    explicit Impl(const Options& options)
        : m_options(options)
    {
        if (!m_options.time_source) {
            m_options.time_source = systemTimeSource();
        }
    }

    Result<MonitorConfig> load(const std::string& path) {
        std::error_code ec;
        std::filesystem::path file(path);

        if (!std::filesystem::is_regular_file(file, ec)) {
            VIGIL_LOG_ERROR_F("Configuration file not found: %s", path.c_str());
            return ErrorCode::ConfigFileNotFound;
        }

        auto size = std::filesystem::file_size(file, ec);
        if (ec) {
            return ErrorCode::FileReadError;
        }
        if (size > m_options.max_file_size) {
            VIGIL_LOG_ERROR_F("Configuration file too large: %s (%llu bytes)",
                              path.c_str(), static_cast<unsigned long long>(size));
            return ErrorCode::FileTooLarge;
        }

        std::ifstream stream(file, std::ios::binary);
        if (!stream) {
            return ErrorCode::FileReadError;
        }

        std::ostringstream contents;
        contents << stream.rdbuf();
        if (stream.bad()) {
            return ErrorCode::FileReadError;
        }

        return loadFromString(contents.str());
    }

    Result<MonitorConfig> loadFromString(std::string_view text) {
        json doc = json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            VIGIL_LOG_ERROR("Configuration is not valid JSON");
            return ErrorCode::JsonParseFailed;
        }
        if (!doc.is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        auto keepAlive = doc.find("keepAlive");
        if (keepAlive == doc.end()) {
            return ErrorCode::MissingField;
        }
        if (!keepAlive->is_object()) {
            return ErrorCode::InvalidFieldType;
        }

        std::optional<int64_t> timeout;
        std::optional<int64_t> warning;
        std::optional<int64_t> interval;

        ErrorCode code = readMilliseconds(*keepAlive, "timeoutMs", timeout);
        if (isFailure(code)) return code;
        code = readMilliseconds(*keepAlive, "warningMs", warning);
        if (isFailure(code)) return code;
        code = readMilliseconds(*keepAlive, "checkIntervalMs", interval);
        if (isFailure(code)) return code;

        if (!timeout) {
            return ErrorCode::MissingField;
        }
        if (*timeout <= 0) {
            return ErrorCode::ConfigInvalid;
        }
        // The interval is derived from timeout - warning
        if (warning && (*warning <= 0 || *warning >= *timeout)) {
            VIGIL_LOG_ERROR_F("Configuration warningMs %lld must lie in (0, timeoutMs)",
                              static_cast<long long>(*warning));
            return ErrorCode::ConfigInvalid;
        }

        // Fill the gaps the same way fromTimeout() does
        auto derived = Network::KeepAliveData::fromTimeout(
            Milliseconds{*timeout}, m_options.time_source());
        if (warning) {
            derived.setWarningThreshold(Milliseconds{*warning});
        }
        if (interval) {
            derived.setCheckInterval(Milliseconds{*interval});
        } else if (warning) {
            derived.setCheckInterval(Milliseconds{(*timeout - *warning) / 3});
        }

        if (derived.validate().isFailure()) {
            VIGIL_LOG_ERROR_F("Configuration has inconsistent keep-alive timings (%s)",
                              derived.describe().c_str());
            return ErrorCode::ConfigInvalid;
        }

        MonitorConfig config;
        config.keepAlive = derived;

        if (auto logging = doc.find("logging"); logging != doc.end()) {
            code = parseLogging(*logging, config.logging);
            if (isFailure(code)) return code;
        }

        return config;
    }

private:
    Options m_options;
};

// ============================================================================
// KeepAliveConfigLoader Public API
// ============================================================================

KeepAliveConfigLoader::KeepAliveConfigLoader()
    : KeepAliveConfigLoader(Options{})
{
}

KeepAliveConfigLoader::KeepAliveConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options))
{
}

KeepAliveConfigLoader::~KeepAliveConfigLoader() = default;

Result<MonitorConfig> KeepAliveConfigLoader::load(const std::string& path) {
    return m_impl->load(path);
}

Result<MonitorConfig> KeepAliveConfigLoader::loadFromString(std::string_view text) {
    return m_impl->loadFromString(text);
}

bool initializeLogging(const LoggingSettings& settings) {
    Core::LogOutput outputs = Core::LogOutput::Console;
    if (!settings.file.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    return Core::Logger::Instance().Initialize(
        settings.level, outputs, settings.file, settings.maxFileSizeMB);
}

} // namespace Vigil::Config
