// SPDX-License-Identifier: Apache-2.0
#include <detection/SilenceDetectionConfig.hpp>
#include <voxcap/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace voxcap;

namespace
{

auto writeTempConfig(std::string const& name, std::string const& content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}

} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("defaultRecordingDir returns a path under data dir", "[config]")
{
    auto const recordingDir = defaultRecordingDir();
    REQUIRE(recordingDir.starts_with(defaultDataDir()));
    REQUIRE(recordingDir.ends_with("recordings"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.recording.deviceName.empty());
    CHECK(config.recording.maxDurationSeconds == 120);
    CHECK(config.recording.maxFileSizeBytes == 25 * 1024 * 1024);
    CHECK(config.recording.silenceDetectionEnabled);
    CHECK(config.recording.silenceDurationMs == 3000);
    CHECK(config.logLevel == log::Level::Info);
    CHECK(validateConfig(config));
}

TEST_CASE("SilenceDetectionConfig has expected defaults", "[config]")
{
    auto const config = SilenceDetectionConfig {};
    CHECK(config.checkIntervalMs == 100);
    CHECK(config.minRecordingDurationMs == 2000);
    CHECK(config.calibrationDurationMs == 1500);
    CHECK(config.noiseFloorMultiplier == 1.5);
    CHECK(config.speechThresholdMultiplier == 4.0);
    CHECK(config.silenceThresholdPercent == 0.20);
    CHECK(config.movingAverageSamples == 10);
    CHECK(config.peakDecayRate == 0.998);
    CHECK(config.minPeakLevel == 0.05);
    CHECK(config.speechConfirmationSamples == 3);
    CHECK(config.silenceConfirmationSamples == 5);
    CHECK(config.ambientDecrement == 1);
    CHECK(validate(config));
}

TEST_CASE("Default durations are among the offered presets", "[config]")
{
    auto const config = AppConfig {};
    CHECK(std::ranges::contains(SilenceDurationPresetsMs, config.recording.silenceDurationMs));
    CHECK(std::ranges::contains(MaxDurationPresetsSeconds, config.recording.maxDurationSeconds));
}

TEST_CASE("validate rejects out-of-range detection values", "[config]")
{
    auto config = SilenceDetectionConfig {};

    SECTION("percent must stay below one")
    {
        config.silenceThresholdPercent = 1.5;
    }
    SECTION("decay rate must be positive")
    {
        config.peakDecayRate = 0.0;
    }
    SECTION("FFT size must be a power of two")
    {
        config.fftSize = 300;
    }
    SECTION("moving average needs a window")
    {
        config.movingAverageSamples = 0;
    }
    SECTION("calibration window is bounded")
    {
        config.calibrationDurationMs = MaxCalibrationDurationMs + 1;
    }

    auto const valid = validate(config);
    REQUIRE(!valid.has_value());
    CHECK(valid.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("toRecordingOptions carries recording and detection settings", "[config]")
{
    auto config = AppConfig {};
    config.recording.deviceName = "usb";
    config.recording.maxDurationSeconds = 60;
    config.recording.silenceDurationMs = 5000;
    config.silenceDetection.ambientDecrement = 2;

    auto const options = toRecordingOptions(config);
    CHECK(options.deviceName == "usb");
    CHECK(options.maxDurationSeconds == 60);
    CHECK(options.silenceDurationMs == 5000);
    CHECK(options.detection.ambientDecrement == 2);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("voxcap_test_config.json", R"({
        "recording": {
            "deviceName": "Blue Yeti",
            "maxDurationSeconds": 300,
            "maxFileSizeBytes": 1048576,
            "silenceDetectionEnabled": false,
            "silenceDurationMs": 5000
        },
        "silenceDetection": {
            "calibrationDurationMs": 1000,
            "speechThresholdMultiplier": 3.0,
            "ambientDecrement": 2
        },
        "output": {
            "directory": "/tmp/voxcap-recordings"
        },
        "log": {
            "level": "debug"
        }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Recording config")
    {
        CHECK(config.recording.deviceName == "Blue Yeti");
        CHECK(config.recording.maxDurationSeconds == 300);
        CHECK(config.recording.maxFileSizeBytes == 1048576);
        CHECK(config.recording.silenceDetectionEnabled == false);
        CHECK(config.recording.silenceDurationMs == 5000);
    }

    SECTION("Silence detection config")
    {
        CHECK(config.silenceDetection.calibrationDurationMs == 1000);
        CHECK(config.silenceDetection.speechThresholdMultiplier == 3.0);
        CHECK(config.silenceDetection.ambientDecrement == 2);
        // Unspecified values keep their defaults.
        CHECK(config.silenceDetection.movingAverageSamples == 10);
    }

    SECTION("Output and log config")
    {
        CHECK(config.output.directory == "/tmp/voxcap-recordings");
        CHECK(config.logLevel == log::Level::Debug);
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a config that loads back", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "voxcap_test_dir" / "config.json";

    auto config = AppConfig {};
    config.recording.deviceName = "headset";
    config.recording.maxDurationSeconds = 30;
    config.silenceDetection.peakDecayRate = 0.99;
    config.logLevel = log::Level::Warning;

    REQUIRE(saveConfigToFile(tempPath.string(), config));

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->recording.deviceName == "headset");
    CHECK(loaded->recording.maxDurationSeconds == 30);
    CHECK(loaded->silenceDetection.peakDecayRate == 0.99);
    CHECK(loaded->logLevel == log::Level::Warning);

    std::filesystem::remove_all(tempPath.parent_path());
}

TEST_CASE("loadConfigFromFile rejects out-of-range values", "[config]")
{
    auto const tempPath = writeTempConfig("voxcap_test_range.json", R"({
        "recording": { "maxFileSizeBytes": 104857600 }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects an oversized calibration window", "[config]")
{
    auto const tempPath = writeTempConfig("voxcap_test_calibration.json", R"({
        "silenceDetection": { "calibrationDurationMs": 4000000000, "checkIntervalMs": 1 }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects an unknown log level", "[config]")
{
    auto const tempPath = writeTempConfig("voxcap_test_level.json", R"({ "log": { "level": "loud" } })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("voxcap_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("defaultDataDir returns a non-empty path", "[config]")
{
    auto const dir = defaultDataDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("log::parseLevel accepts known names", "[config]")
{
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK_FALSE(log::parseLevel("verbose").has_value());
}

TEST_CASE("log::raisedBy adds one level per -v flag", "[config]")
{
    CHECK(log::raisedBy(log::Level::Info, 0) == log::Level::Info);
    CHECK(log::raisedBy(log::Level::Info, 1) == log::Level::Debug);
    CHECK(log::raisedBy(log::Level::Warning, 1) == log::Level::Info);
    CHECK(log::raisedBy(log::Level::Info, 5) == log::Level::Trace);
}
