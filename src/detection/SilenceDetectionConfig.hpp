// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <cstdint>

namespace voxcap
{

constexpr auto MaxCalibrationDurationMs = std::uint32_t { 60'000 };

/// @brief Tunables of the adaptive silence detector.
///
/// Defaults are the production values. Every field may be overridden from the config file
/// or directly in tests.
struct SilenceDetectionConfig
{
    /// @brief Cadence of the detection timer.
    std::uint32_t checkIntervalMs = 100;

    /// @brief No silence stop is issued before the session is this old.
    std::uint32_t minRecordingDurationMs = 2000;

    /// @brief Sustained silence (after speech) required to stop the session.
    std::uint32_t silenceDurationMs = 3000;

    /// @brief Length of the noise-floor calibration window at session start.
    ///
    /// At most MaxCalibrationDurationMs.
    std::uint32_t calibrationDurationMs = 1500;

    double noiseFloorMultiplier = 1.5;
    double speechThresholdMultiplier = 4.0;
    double silenceThresholdPercent = 0.20;

    /// @brief Number of raw samples in the loudness moving average.
    std::uint32_t movingAverageSamples = 10;

    double peakDecayRate = 0.998;
    double minPeakLevel = 0.05;

    std::uint32_t speechConfirmationSamples = 3;
    std::uint32_t silenceConfirmationSamples = 5;

    /// @brief How far one ambient-zone tick walks back the consecutive-silence counter.
    ///
    /// 1 keeps accumulated silence evidence across a single noise spike. Setting it to
    /// silenceConfirmationSamples or higher turns it into a hard reset.
    std::uint32_t ambientDecrement = 1;

    /// @brief FFT size of the device analyser (frequencyBinCount is half of it).
    std::uint32_t fftSize = 256;

    /// @brief Analyser smoothing between consecutive snapshots (0 = none).
    double smoothingTimeConstant = 0.3;
};

/// @brief Silence durations offered to the user, in milliseconds.
inline constexpr auto SilenceDurationPresetsMs = std::array<std::uint32_t, 4> { 2000, 3000, 4000, 5000 };

/// @brief Maximum recording durations offered to the user, in seconds.
inline constexpr auto MaxDurationPresetsSeconds = std::array<std::uint32_t, 5> { 30, 60, 120, 180, 300 };

/// @brief Checks that the tunables describe a usable detector.
/// @return Success, or an InvalidArgument error naming the offending field.
[[nodiscard]] auto validate(const SilenceDetectionConfig& config) -> VoidResult;

} // namespace voxcap
