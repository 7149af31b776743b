// SPDX-License-Identifier: Apache-2.0
#include "SilenceDetector.hpp"

#include <core/Log.hpp>

namespace voxcap
{

SilenceDetector::SilenceDetector(const SilenceDetectionConfig& config):
    _config(config),
    _average(config.movingAverageSamples),
    _calibrator(config),
    _tracker(config),
    _endpoint(config)
{
}

auto SilenceDetector::tick(const LoudnessSample& sample) -> TickResult
{
    auto result = TickResult {};
    result.average = _average.push(sample.value);

    if (!_calibrator.isComplete())
    {
        auto calibration = _calibrator.addSample(sample.value, sample.elapsedMs);
        // No endpoint decision may be pending while the noise floor is unknown.
        _endpoint.clearSilenceTimer();

        if (!calibration)
        {
            result.phase = DetectionPhase::Calibrating;
            _last = result;
            return result;
        }

        _tracker.reset(*calibration);
        result.calibrationCompleted = true;
    }

    result.phase = DetectionPhase::Detecting;
    result.thresholds = _tracker.update(result.average);
    result.silenceDetected = _endpoint.update(result.average, result.thresholds, sample.elapsedMs);
    result.endpoint = _endpoint.state();

    log::trace("tick {} ms: rms {:.4f} avg {:.4f} speech>{:.4f} silence<{:.4f} peak {:.4f} [{}]",
               sample.elapsedMs,
               sample.value,
               result.average,
               result.thresholds.speech,
               result.thresholds.silence,
               _tracker.peakSpeechLevel(),
               endpointStateName(result.endpoint));

    _last = result;
    return result;
}

} // namespace voxcap
