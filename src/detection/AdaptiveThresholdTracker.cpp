// SPDX-License-Identifier: Apache-2.0
#include "AdaptiveThresholdTracker.hpp"

#include <algorithm>

namespace voxcap
{

AdaptiveThresholdTracker::AdaptiveThresholdTracker(const SilenceDetectionConfig& config):
    _config(config), _peakSpeechLevel(config.minPeakLevel)
{
}

void AdaptiveThresholdTracker::reset(const CalibrationResult& calibration)
{
    _noiseFloor = calibration.baselineNoise;
    _peakSpeechLevel = std::max(calibration.initialPeak, _config.minPeakLevel);
}

auto AdaptiveThresholdTracker::speechThreshold() const noexcept -> double
{
    return _noiseFloor * _config.speechThresholdMultiplier;
}

auto AdaptiveThresholdTracker::update(double average) -> Thresholds
{
    if (average > speechThreshold() && average > _peakSpeechLevel)
        _peakSpeechLevel = average;
    else
        _peakSpeechLevel = std::max(_peakSpeechLevel * _config.peakDecayRate, _config.minPeakLevel);

    return thresholds();
}

auto AdaptiveThresholdTracker::thresholds() const noexcept -> Thresholds
{
    return Thresholds {
        .speech = speechThreshold(),
        .silence = std::max(_peakSpeechLevel * _config.silenceThresholdPercent, _noiseFloor),
    };
}

} // namespace voxcap
