// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voxcap
{

namespace
{

    auto toUInt32(std::uint64_t value) -> std::uint32_t
    {
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(value, UINT32_MAX));
    }

    void readSilenceDetection(const nlohmann::json& section, SilenceDetectionConfig& sd)
    {
        sd.checkIntervalMs = toUInt32(json::getUInt64Or(section, "checkIntervalMs", sd.checkIntervalMs));
        sd.minRecordingDurationMs =
            toUInt32(json::getUInt64Or(section, "minRecordingDurationMs", sd.minRecordingDurationMs));
        sd.calibrationDurationMs =
            toUInt32(json::getUInt64Or(section, "calibrationDurationMs", sd.calibrationDurationMs));
        sd.noiseFloorMultiplier = json::getDoubleOr(section, "noiseFloorMultiplier", sd.noiseFloorMultiplier);
        sd.speechThresholdMultiplier =
            json::getDoubleOr(section, "speechThresholdMultiplier", sd.speechThresholdMultiplier);
        sd.silenceThresholdPercent =
            json::getDoubleOr(section, "silenceThresholdPercent", sd.silenceThresholdPercent);
        sd.movingAverageSamples =
            toUInt32(json::getUInt64Or(section, "movingAverageSamples", sd.movingAverageSamples));
        sd.peakDecayRate = json::getDoubleOr(section, "peakDecayRate", sd.peakDecayRate);
        sd.minPeakLevel = json::getDoubleOr(section, "minPeakLevel", sd.minPeakLevel);
        sd.speechConfirmationSamples =
            toUInt32(json::getUInt64Or(section, "speechConfirmationSamples", sd.speechConfirmationSamples));
        sd.silenceConfirmationSamples =
            toUInt32(json::getUInt64Or(section, "silenceConfirmationSamples", sd.silenceConfirmationSamples));
        sd.ambientDecrement = toUInt32(json::getUInt64Or(section, "ambientDecrement", sd.ambientDecrement));
        sd.fftSize = toUInt32(json::getUInt64Or(section, "fftSize", sd.fftSize));
        sd.smoothingTimeConstant = json::getDoubleOr(section, "smoothingTimeConstant", sd.smoothingTimeConstant);
    }

    auto writeSilenceDetection(const SilenceDetectionConfig& sd) -> nlohmann::json
    {
        auto section = nlohmann::json::object();
        section["checkIntervalMs"] = sd.checkIntervalMs;
        section["minRecordingDurationMs"] = sd.minRecordingDurationMs;
        section["calibrationDurationMs"] = sd.calibrationDurationMs;
        section["noiseFloorMultiplier"] = sd.noiseFloorMultiplier;
        section["speechThresholdMultiplier"] = sd.speechThresholdMultiplier;
        section["silenceThresholdPercent"] = sd.silenceThresholdPercent;
        section["movingAverageSamples"] = sd.movingAverageSamples;
        section["peakDecayRate"] = sd.peakDecayRate;
        section["minPeakLevel"] = sd.minPeakLevel;
        section["speechConfirmationSamples"] = sd.speechConfirmationSamples;
        section["silenceConfirmationSamples"] = sd.silenceConfirmationSamples;
        section["ambientDecrement"] = sd.ambientDecrement;
        section["fftSize"] = sd.fftSize;
        section["smoothingTimeConstant"] = sd.smoothingTimeConstant;
        return section;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voxcap";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voxcap";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/voxcap";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voxcap";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voxcap";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voxcap";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/voxcap";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/voxcap";
    return ".";
#endif
}

auto defaultRecordingDir() -> std::string
{
    return defaultDataDir() + "/recordings";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto toRecordingOptions(const AppConfig& config) -> RecordingOptions
{
    return RecordingOptions {
        .deviceName = config.recording.deviceName,
        .maxDurationSeconds = config.recording.maxDurationSeconds,
        .maxFileSizeBytes = config.recording.maxFileSizeBytes,
        .silenceDetectionEnabled = config.recording.silenceDetectionEnabled,
        .silenceDurationMs = config.recording.silenceDurationMs,
        .detection = config.silenceDetection,
    };
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.recording.maxDurationSeconds == 0)
        return makeError(ErrorCode::ConfigError, "recording.maxDurationSeconds must be positive");
    if (config.recording.maxFileSizeBytes == 0 || config.recording.maxFileSizeBytes > MaxUploadBytes)
        return makeError(ErrorCode::ConfigError,
                         std::format("recording.maxFileSizeBytes must be in 1..{}", MaxUploadBytes));
    if (config.recording.silenceDurationMs == 0)
        return makeError(ErrorCode::ConfigError, "recording.silenceDurationMs must be positive");

    if (auto valid = validate(config.silenceDetection); !valid)
        return makeError(ErrorCode::ConfigError, valid.error().message);

    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config root must be an object: {}", path));

    auto config = AppConfig {};

    // Recording section
    if (root.contains("recording"))
    {
        auto const& recording = root["recording"];
        config.recording.deviceName = json::getStringOr(recording, "deviceName", "");
        config.recording.maxDurationSeconds =
            toUInt32(json::getUInt64Or(recording, "maxDurationSeconds", config.recording.maxDurationSeconds));
        config.recording.maxFileSizeBytes =
            json::getUInt64Or(recording, "maxFileSizeBytes", config.recording.maxFileSizeBytes);
        config.recording.silenceDetectionEnabled =
            json::getBoolOr(recording, "silenceDetectionEnabled", config.recording.silenceDetectionEnabled);
        config.recording.silenceDurationMs =
            toUInt32(json::getUInt64Or(recording, "silenceDurationMs", config.recording.silenceDurationMs));
    }

    // Silence detection tunables
    if (root.contains("silenceDetection"))
        readSilenceDetection(root["silenceDetection"], config.silenceDetection);

    // Output section
    if (root.contains("output"))
        config.output.directory = json::getStringOr(root["output"], "directory", "");

    // Log section
    if (root.contains("log"))
    {
        auto const levelName = json::getStringOr(root["log"], "level", "info");
        auto const level = log::parseLevel(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
        config.logLevel = *level;
    }

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto recording = nlohmann::json::object();
    if (!config.recording.deviceName.empty())
        recording["deviceName"] = config.recording.deviceName;
    recording["maxDurationSeconds"] = config.recording.maxDurationSeconds;
    recording["maxFileSizeBytes"] = config.recording.maxFileSizeBytes;
    recording["silenceDetectionEnabled"] = config.recording.silenceDetectionEnabled;
    recording["silenceDurationMs"] = config.recording.silenceDurationMs;
    root["recording"] = std::move(recording);

    root["silenceDetection"] = writeSilenceDetection(config.silenceDetection);

    auto output = nlohmann::json::object();
    if (!config.output.directory.empty())
        output["directory"] = config.output.directory;
    root["output"] = std::move(output);

    root["log"] = nlohmann::json { { "level", log::levelName(config.logLevel) } };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voxcap
