// SPDX-License-Identifier: Apache-2.0
#include "EndpointDetector.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voxcap
{

EndpointDetector::EndpointDetector(const SilenceDetectionConfig& config): _config(config)
{
}

void EndpointDetector::reset() noexcept
{
    _counters = HysteresisCounters {};
    _fired = false;
    _firedThisTick = false;
}

auto EndpointDetector::update(double average, const Thresholds& thresholds, std::uint64_t elapsedMs) -> bool
{
    _firedThisTick = false;

    if (average > thresholds.speech)
    {
        ++_counters.consecutiveSpeech;
        _counters.consecutiveSilence = 0;
        _counters.silenceStartedAtMs.reset();

        if (!_counters.speechConfirmed && _counters.consecutiveSpeech >= _config.speechConfirmationSamples)
        {
            _counters.speechConfirmed = true;
            log::debug("Speech confirmed at {} ms (avg {:.4f} > {:.4f})", elapsedMs, average, thresholds.speech);
        }
        return false;
    }

    _counters.consecutiveSpeech = 0;

    // Silence only counts after the user has actually spoken.
    if (!_counters.speechConfirmed)
        return false;

    if (average < thresholds.silence)
        onSilentTick(elapsedMs);
    else
        onAmbientTick();

    return _firedThisTick;
}

void EndpointDetector::onSilentTick(std::uint64_t elapsedMs)
{
    ++_counters.consecutiveSilence;
    if (_counters.consecutiveSilence < _config.silenceConfirmationSamples)
        return;

    if (!_counters.silenceStartedAtMs)
    {
        _counters.silenceStartedAtMs = elapsedMs;
        log::trace("Silence timer started at {} ms", elapsedMs);
        return;
    }

    if (_fired)
        return;

    auto const silentFor = elapsedMs - *_counters.silenceStartedAtMs;
    if (silentFor >= _config.silenceDurationMs && elapsedMs >= _config.minRecordingDurationMs)
    {
        _fired = true;
        _firedThisTick = true;
        log::info("Silence detected after {} ms of quiet", silentFor);
    }
}

void EndpointDetector::onAmbientTick()
{
    auto const decrement = std::min(_counters.consecutiveSilence, _config.ambientDecrement);
    _counters.consecutiveSilence -= decrement;

    if (_counters.consecutiveSilence < _config.silenceConfirmationSamples)
        _counters.silenceStartedAtMs.reset();
}

auto EndpointDetector::state() const noexcept -> EndpointState
{
    if (_fired)
        return EndpointState::SilenceTriggered;
    if (!_counters.speechConfirmed)
        return EndpointState::AwaitingSpeech;
    if (_counters.consecutiveSilence > 0)
        return EndpointState::SilenceAccumulating;
    return EndpointState::SpeechConfirmed;
}

} // namespace voxcap
