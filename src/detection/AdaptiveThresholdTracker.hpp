// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/Calibrator.hpp>
#include <detection/SilenceDetectionConfig.hpp>

namespace voxcap
{

/// @brief The two decision boundaries in effect for one tick.
struct Thresholds
{
    double speech = 0.0;
    double silence = 0.0;
};

/// @brief Tracks a decaying running peak of speech loudness.
///
/// The noise floor is fixed once calibration completes. The peak jumps up to any louder
/// speech level and otherwise decays by peakDecayRate per tick, never below minPeakLevel.
class AdaptiveThresholdTracker
{
  public:
    explicit AdaptiveThresholdTracker(const SilenceDetectionConfig& config);

    /// @brief Seeds the tracker from a finished calibration.
    void reset(const CalibrationResult& calibration);

    /// @brief Advances the peak estimate by one tick.
    /// @param average Moving-averaged loudness of this tick.
    /// @return The speech and silence thresholds to apply to this tick.
    auto update(double average) -> Thresholds;

    /// @brief Thresholds for the current peak, without advancing it.
    [[nodiscard]] auto thresholds() const noexcept -> Thresholds;

    [[nodiscard]] auto noiseFloor() const noexcept -> double { return _noiseFloor; }
    [[nodiscard]] auto peakSpeechLevel() const noexcept -> double { return _peakSpeechLevel; }
    [[nodiscard]] auto speechThreshold() const noexcept -> double;

  private:
    SilenceDetectionConfig _config;
    double _noiseFloor = 0.0;
    double _peakSpeechLevel;
};

} // namespace voxcap
