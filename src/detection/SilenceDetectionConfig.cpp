// SPDX-License-Identifier: Apache-2.0
#include "SilenceDetectionConfig.hpp"

#include <format>

namespace voxcap
{

auto validate(const SilenceDetectionConfig& config) -> VoidResult
{
    auto const invalid = [](std::string_view field, auto value) {
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid silence detection {}: {}", field, value));
    };

    if (config.checkIntervalMs == 0)
        return invalid("checkIntervalMs", config.checkIntervalMs);
    if (config.silenceDurationMs == 0)
        return invalid("silenceDurationMs", config.silenceDurationMs);
    if (config.calibrationDurationMs > MaxCalibrationDurationMs)
        return invalid("calibrationDurationMs", config.calibrationDurationMs);
    if (config.movingAverageSamples == 0)
        return invalid("movingAverageSamples", config.movingAverageSamples);
    if (config.noiseFloorMultiplier <= 0.0)
        return invalid("noiseFloorMultiplier", config.noiseFloorMultiplier);
    if (config.speechThresholdMultiplier <= 0.0)
        return invalid("speechThresholdMultiplier", config.speechThresholdMultiplier);
    if (config.silenceThresholdPercent <= 0.0 || config.silenceThresholdPercent >= 1.0)
        return invalid("silenceThresholdPercent", config.silenceThresholdPercent);
    if (config.peakDecayRate <= 0.0 || config.peakDecayRate > 1.0)
        return invalid("peakDecayRate", config.peakDecayRate);
    if (config.minPeakLevel <= 0.0 || config.minPeakLevel > 1.0)
        return invalid("minPeakLevel", config.minPeakLevel);
    if (config.speechConfirmationSamples == 0)
        return invalid("speechConfirmationSamples", config.speechConfirmationSamples);
    if (config.silenceConfirmationSamples == 0)
        return invalid("silenceConfirmationSamples", config.silenceConfirmationSamples);
    if (config.fftSize < 32 || (config.fftSize & (config.fftSize - 1)) != 0)
        return invalid("fftSize", config.fftSize);
    if (config.smoothingTimeConstant < 0.0 || config.smoothingTimeConstant >= 1.0)
        return invalid("smoothingTimeConstant", config.smoothingTimeConstant);

    return {};
}

} // namespace voxcap
