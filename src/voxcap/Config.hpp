// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <detection/SilenceDetectionConfig.hpp>
#include <session/RecordingOptions.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace voxcap
{

/// @brief Recording section of the config file.
struct RecordingConfig
{
    /// @brief Case-insensitive substring of the capture device name; empty for the default.
    std::string deviceName;
    std::uint32_t maxDurationSeconds = 120;
    std::uint64_t maxFileSizeBytes = MaxUploadBytes;
    bool silenceDetectionEnabled = true;
    std::uint32_t silenceDurationMs = 3000;
};

/// @brief Where finished recordings are written.
struct OutputConfig
{
    /// @brief Directory for recording files; empty means the default data directory.
    std::string directory;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    RecordingConfig recording;
    SilenceDetectionConfig silenceDetection;
    OutputConfig output;
    log::Level logLevel = log::Level::Info;
};

/// @brief Builds session options from the configuration.
[[nodiscard]] auto toRecordingOptions(const AppConfig& config) -> RecordingOptions;

/// @brief Checks ranges of all configured values.
/// @return Success or a ConfigError naming the offending value.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads and validates the configuration from a specific file.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/voxcap or ~/.local/share/voxcap
/// On macOS: ~/Library/Application Support/voxcap
/// On Windows: %APPDATA%\voxcap
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the directory recordings are written to by default.
[[nodiscard]] auto defaultRecordingDir() -> std::string;

} // namespace voxcap
