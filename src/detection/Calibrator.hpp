// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/SilenceDetectionConfig.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace voxcap
{

/// @brief Noise floor and starting peak derived from the calibration window.
struct CalibrationResult
{
    double baselineNoise = 0.0;
    double initialPeak = 0.0;
    std::size_t sampleCount = 0;
};

/// @brief Estimates the ambient noise floor from the first samples of a session.
///
/// Samples are collected while their timestamp lies inside the calibration window. The first
/// sample at or past the window end completes calibration; it is not itself collected.
class Calibrator
{
  public:
    explicit Calibrator(const SilenceDetectionConfig& config);

    /// @brief Offers one raw loudness sample.
    /// @return The calibration result once, on the tick that completes calibration.
    [[nodiscard]] auto addSample(double value, std::uint64_t elapsedMs) -> std::optional<CalibrationResult>;

    /// @brief Returns true once the calibration window has closed.
    [[nodiscard]] auto isComplete() const noexcept -> bool { return _complete; }

    /// @brief Number of samples collected so far (0 after completion).
    [[nodiscard]] auto sampleCount() const noexcept -> std::size_t { return _samples.size(); }

    /// @brief Derives baseline and initial peak from a set of calibration samples.
    ///
    /// Uses the median for the noise floor so a single loud outlier does not skew it,
    /// and the 90th percentile (floored at minPeakLevel) for the initial peak.
    [[nodiscard]] static auto compute(std::vector<double> samples, const SilenceDetectionConfig& config)
        -> CalibrationResult;

  private:
    double _windowMs;
    SilenceDetectionConfig _config;
    std::vector<double> _samples;
    bool _complete = false;
};

} // namespace voxcap
