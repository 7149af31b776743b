// SPDX-License-Identifier: Apache-2.0
#include "Calibrator.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voxcap
{

Calibrator::Calibrator(const SilenceDetectionConfig& config):
    _windowMs(static_cast<double>(config.calibrationDurationMs)), _config(config)
{
}

auto Calibrator::addSample(double value, std::uint64_t elapsedMs) -> std::optional<CalibrationResult>
{
    if (_complete)
        return std::nullopt;

    if (static_cast<double>(elapsedMs) < _windowMs)
    {
        _samples.push_back(value);
        return std::nullopt;
    }

    _complete = true;
    auto result = compute(std::move(_samples), _config);
    _samples = {};

    log::debug("Calibration complete: {} samples, baseline noise {:.4f}, initial peak {:.4f}",
               result.sampleCount,
               result.baselineNoise,
               result.initialPeak);
    return result;
}

auto Calibrator::compute(std::vector<double> samples, const SilenceDetectionConfig& config) -> CalibrationResult
{
    if (samples.empty())
    {
        // Device stayed silent or unavailable for the whole window.
        return CalibrationResult {
            .baselineNoise = config.minPeakLevel * config.silenceThresholdPercent,
            .initialPeak = config.minPeakLevel,
            .sampleCount = 0,
        };
    }

    std::ranges::sort(samples);

    auto const count = samples.size();
    auto const median = samples[count / 2];
    auto const p90Index = std::min(count - 1, static_cast<std::size_t>(static_cast<double>(count) * 0.9));

    return CalibrationResult {
        .baselineNoise = median * config.noiseFloorMultiplier,
        .initialPeak = std::max(samples[p90Index], config.minPeakLevel),
        .sampleCount = count,
    };
}

} // namespace voxcap
