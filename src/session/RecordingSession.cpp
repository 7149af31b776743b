// SPDX-License-Identifier: Apache-2.0
#include "RecordingSession.hpp"

#include <core/Log.hpp>

#include <cstdint>
#include <format>

namespace voxcap
{

struct RecordingSession::Active
{
    RecordingOptions options;
    std::chrono::steady_clock::time_point startedAt;
    CaptureLease lease;
    EnergySampler sampler;
    std::optional<SilenceDetector> detector;
    double lastLoudness = 0.0;
    bool stopping = false; // first stop trigger wins

    Active(const RecordingOptions& opts, std::chrono::steady_clock::time_point now, CaptureDevice& device):
        options(opts), startedAt(now), lease(device), sampler(device)
    {
    }
};

RecordingSession::RecordingSession(CaptureDevice& device, SessionEvents events, Clock clock):
    _device(device),
    _events(std::move(events)),
    _clock(clock ? std::move(clock) : Clock { [] { return std::chrono::steady_clock::now(); } })
{
}

RecordingSession::~RecordingSession()
{
    // Dropping the active state aborts the device through its lease.
    if (_active)
        log::warning("Recording session destroyed while capturing, discarding audio");
}

auto RecordingSession::start(const RecordingOptions& options) -> VoidResult
{
    if (_state != SessionState::Idle)
        return makeError(ErrorCode::InvalidState,
                         std::format("Cannot start recording while {}", sessionStateName(_state)));

    if (options.maxDurationSeconds == 0)
        return makeError(ErrorCode::InvalidArgument, "maxDurationSeconds must be positive");
    if (options.maxFileSizeBytes == 0)
        return makeError(ErrorCode::InvalidArgument, "maxFileSizeBytes must be positive");

    auto detection = options.detection;
    detection.silenceDurationMs = options.silenceDurationMs;
    if (options.silenceDetectionEnabled)
    {
        if (auto valid = validate(detection); !valid)
            return valid;
        if (std::uint64_t { detection.calibrationDurationMs } >= std::uint64_t { options.maxDurationSeconds } * 1000)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Calibration window of {} ms does not fit in a {} s recording",
                                         detection.calibrationDurationMs,
                                         options.maxDurationSeconds));
    }

    if (auto opened = _device.open(options.deviceName); !opened)
    {
        // A device that fails to open may still hold a context.
        _device.abort();
        auto error = opened.error();
        error.code = ErrorCode::DeviceUnavailable;
        log::error("Failed to start recording: {}", error.message);
        return std::unexpected(std::move(error));
    }

    auto active = std::make_unique<Active>(options, _clock(), _device);
    active->options.detection = detection;

    if (options.silenceDetectionEnabled)
    {
        if (auto attached = _device.attachAnalyser(detection); attached)
            active->detector.emplace(detection);
        else
            log::warning("Silence detection setup failed, continuing without auto-stop: {}",
                         attached.error().message);
    }

    _active = std::move(active);

    log::info("Recording started (max {} s, silence auto-stop {})",
              options.maxDurationSeconds,
              _active->detector ? std::format("after {} ms", detection.silenceDurationMs) : "off");

    setState(_active->detector ? SessionState::Calibrating : SessionState::Listening);
    return {};
}

auto RecordingSession::stop() -> Result<Recording>
{
    if (!_active)
    {
        if (_lastRecording)
            return *_lastRecording;
        return makeError(ErrorCode::InvalidState, "No recording available");
    }

    return finalize(StopReason::Manual);
}

void RecordingSession::onDetectionTick()
{
    if (!isCapturing() || !_active->detector)
        return;

    auto const elapsedMs = static_cast<std::uint64_t>(elapsed().count());
    auto const sample = _active->sampler.sample(elapsedMs);
    if (!sample)
        return;

    _active->lastLoudness = sample->value;
    auto const result = _active->detector->tick(*sample);

    if (result.calibrationCompleted && _state == SessionState::Calibrating)
        setState(SessionState::Listening);

    if (result.silenceDetected)
    {
        auto recording = finalize(StopReason::SilenceDetected);
        if (!recording)
            log::error("Failed to finalize recording after silence: {}", recording.error().message);
    }
}

void RecordingSession::onDurationTick()
{
    if (!isCapturing())
        return;

    auto const elapsedTime = elapsed();
    auto reason = std::optional<StopReason> {};

    if (!_device.isConnected())
        reason = StopReason::DeviceLost;
    else if (elapsedTime >= std::chrono::seconds(_active->options.maxDurationSeconds))
        reason = StopReason::MaxDuration;
    else if (_device.encodedBytes() >= _active->options.maxFileSizeBytes)
        reason = StopReason::SizeLimit;

    if (!reason)
        return;

    auto recording = finalize(*reason);
    if (!recording)
        log::error("Failed to finalize recording ({}): {}", stopReasonName(*reason), recording.error().message);
}

auto RecordingSession::isCapturing() const noexcept -> bool
{
    return _active && !_active->stopping;
}

auto RecordingSession::silenceDetectionActive() const noexcept -> bool
{
    return _active && _active->detector.has_value();
}

auto RecordingSession::detector() const noexcept -> const SilenceDetector*
{
    if (!_active || !_active->detector)
        return nullptr;
    return &*_active->detector;
}

auto RecordingSession::status() const -> SessionStatus
{
    auto status = SessionStatus { .state = _state };
    if (!_active)
        return status;

    status.elapsed = elapsed();
    status.encodedBytes = _device.encodedBytes();
    status.silenceDetectionActive = _active->detector.has_value();
    status.loudness = _active->lastLoudness;
    if (_active->detector)
    {
        status.thresholds = _active->detector->lastResult().thresholds;
        status.endpoint = _active->detector->endpoint().state();
    }
    return status;
}

auto RecordingSession::elapsed() const -> std::chrono::milliseconds
{
    if (!_active)
        return std::chrono::milliseconds { 0 };
    return std::chrono::duration_cast<std::chrono::milliseconds>(_clock() - _active->startedAt);
}

auto RecordingSession::finalize(StopReason reason) -> Result<Recording>
{
    _active->stopping = true;
    setState(SessionState::Stopping);

    auto const duration = elapsed();
    auto bytes = _active->lease.finish();
    auto const encodedSize = bytes ? bytes->size() : std::size_t { 0 };

    // Drops sampler, calibration, thresholds and hysteresis state of this session.
    _active.reset();

    switch (reason)
    {
        case StopReason::Manual: break;
        case StopReason::SilenceDetected:
            if (_events.onSilenceStop)
                _events.onSilenceStop();
            break;
        case StopReason::MaxDuration:
            log::info("Maximum recording duration reached");
            if (_events.onMaxDurationReached)
                _events.onMaxDurationReached();
            break;
        case StopReason::SizeLimit:
            log::warning("Maximum file size reached ({} bytes), stopping recording", encodedSize);
            if (_events.onSizeLimitReached)
                _events.onSizeLimitReached();
            break;
        case StopReason::DeviceLost:
        {
            auto const error = Error { ErrorCode::DeviceLost, "Audio input disconnected during recording" };
            log::warning("{}", error.message);
            if (_events.onDeviceLost)
                _events.onDeviceLost(error);
            break;
        }
    }

    if (!bytes)
    {
        setState(SessionState::Idle);
        return std::unexpected(std::move(bytes.error()));
    }

    auto recording = Recording {
        .bytes = std::move(*bytes),
        .mimeType = _device.mimeType(),
        .duration = duration,
        .reason = reason,
    };

    log::info("Recording finalized: {} bytes, {} ms, stopped by {}",
              recording.size(),
              recording.duration.count(),
              stopReasonName(reason));

    _lastRecording = recording;
    setState(SessionState::Finalized);
    if (_events.onFinalized)
        _events.onFinalized(recording);
    setState(SessionState::Idle);

    return recording;
}

void RecordingSession::setState(SessionState state)
{
    if (_state == state)
        return;

    log::debug("Session state: {} -> {}", sessionStateName(_state), sessionStateName(state));
    _state = state;
    if (_events.onStateChanged)
        _events.onStateChanged(state);
}

} // namespace voxcap
