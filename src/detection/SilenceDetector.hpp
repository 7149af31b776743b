// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <detection/AdaptiveThresholdTracker.hpp>
#include <detection/Calibrator.hpp>
#include <detection/EndpointDetector.hpp>
#include <detection/MovingAverage.hpp>
#include <detection/SilenceDetectionConfig.hpp>

#include <cstdint>

namespace voxcap
{

/// @brief Which stage handled a tick.
enum class DetectionPhase : std::uint8_t
{
    Calibrating,
    Detecting,
};

/// @brief Outcome of feeding one loudness sample to the detector.
struct TickResult
{
    DetectionPhase phase = DetectionPhase::Calibrating;
    double average = 0.0;        ///< Moving average including this sample.
    Thresholds thresholds;       ///< Zero while calibrating.
    EndpointState endpoint = EndpointState::AwaitingSpeech;
    bool calibrationCompleted = false;  ///< This tick closed the calibration window.
    bool silenceDetected = false;       ///< This tick fired the silence event.
};

/// @brief Per-session adaptive silence detection, advanced one sample at a time.
///
/// Pure with respect to time and hardware: the caller supplies timestamped samples, so the
/// whole pipeline (moving average, calibration, threshold tracking, hysteresis) runs without
/// timers or an audio device.
class SilenceDetector
{
  public:
    explicit SilenceDetector(const SilenceDetectionConfig& config = {});

    /// @brief Advances detection by one sample.
    auto tick(const LoudnessSample& sample) -> TickResult;

    [[nodiscard]] auto config() const noexcept -> const SilenceDetectionConfig& { return _config; }
    [[nodiscard]] auto isCalibrated() const noexcept -> bool { return _calibrator.isComplete(); }
    [[nodiscard]] auto tracker() const noexcept -> const AdaptiveThresholdTracker& { return _tracker; }
    [[nodiscard]] auto endpoint() const noexcept -> const EndpointDetector& { return _endpoint; }
    [[nodiscard]] auto lastResult() const noexcept -> const TickResult& { return _last; }

  private:
    SilenceDetectionConfig _config;
    MovingAverage _average;
    Calibrator _calibrator;
    AdaptiveThresholdTracker _tracker;
    EndpointDetector _endpoint;
    TickResult _last;
};

} // namespace voxcap
