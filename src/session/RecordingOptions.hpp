// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/SilenceDetectionConfig.hpp>

#include <cstdint>
#include <string>

namespace voxcap
{

/// @brief Upload limit of the transcription service; recordings never grow past it.
inline constexpr auto MaxUploadBytes = std::uint64_t { 25 } * 1024 * 1024;

/// @brief Options for a single recording session.
struct RecordingOptions
{
    /// @brief Input device filter, empty for the system default.
    std::string deviceName;

    std::uint32_t maxDurationSeconds = 120;

    std::uint64_t maxFileSizeBytes = MaxUploadBytes;

    /// @brief Whether the session may stop itself once the speaker goes quiet.
    bool silenceDetectionEnabled = true;

    /// @brief Silence required after speech before stopping. Overrides detection.silenceDurationMs.
    std::uint32_t silenceDurationMs = 3000;

    /// @brief Remaining detector tunables.
    SilenceDetectionConfig detection;
};

} // namespace voxcap
