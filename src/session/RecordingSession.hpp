// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <detection/SilenceDetector.hpp>
#include <session/CaptureDevice.hpp>
#include <session/RecordingOptions.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace voxcap
{

/// @brief Observer callbacks of a recording session.
///
/// Invoked synchronously on the thread that drove the transition. Callbacks must not call
/// back into the session (or the controller owning it).
struct SessionEvents
{
    /// @brief The session stopped itself after detecting the end of speech.
    std::function<void()> onSilenceStop;
    std::function<void()> onMaxDurationReached;
    std::function<void()> onSizeLimitReached;
    std::function<void(const Error& error)> onDeviceLost;

    /// @brief A recording was finalized, whatever the reason.
    std::function<void(const Recording& recording)> onFinalized;

    std::function<void(SessionState state)> onStateChanged;
};

/// @brief Live figures for a status display.
struct SessionStatus
{
    SessionState state = SessionState::Idle;
    std::chrono::milliseconds elapsed { 0 };
    std::size_t encodedBytes = 0;
    bool silenceDetectionActive = false;
    double loudness = 0.0;
    Thresholds thresholds;
    EndpointState endpoint = EndpointState::AwaitingSpeech;
};

/// @brief State machine owning the lifecycle of one capture at a time.
///
/// Idle -> Calibrating -> Listening -> Stopping -> Idle. While capturing, the first of
/// manual stop, maximum duration, size limit, detected silence or device loss ends the
/// session; every later trigger is ignored. The session is driven from outside through
/// onDetectionTick() and onDurationTick() and never blocks.
class RecordingSession
{
  public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit RecordingSession(CaptureDevice& device, SessionEvents events = {}, Clock clock = {});
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    /// @brief Opens the device and starts a new session.
    /// @return Success, InvalidState if a session is already running, InvalidArgument for bad
    ///         options, or DeviceUnavailable. On failure the session stays Idle.
    [[nodiscard]] auto start(const RecordingOptions& options) -> VoidResult;

    /// @brief Stops the running session and returns its recording.
    ///
    /// When idle this is a no-op that returns the most recent recording, or InvalidState if
    /// there is none.
    [[nodiscard]] auto stop() -> Result<Recording>;

    /// @brief Samples the device and advances silence detection by one tick.
    void onDetectionTick();

    /// @brief Checks the duration, size and device-loss limits.
    void onDurationTick();

    [[nodiscard]] auto state() const noexcept -> SessionState { return _state; }
    [[nodiscard]] auto isCapturing() const noexcept -> bool;
    [[nodiscard]] auto silenceDetectionActive() const noexcept -> bool;
    [[nodiscard]] auto status() const -> SessionStatus;
    [[nodiscard]] auto lastRecording() const noexcept -> const std::optional<Recording>& { return _lastRecording; }

    /// @brief Read access to the running detector, for diagnostics and tests.
    [[nodiscard]] auto detector() const noexcept -> const SilenceDetector*;

  private:
    struct Active;

    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;
    auto finalize(StopReason reason) -> Result<Recording>;
    void setState(SessionState state);

    CaptureDevice& _device;
    SessionEvents _events;
    Clock _clock;
    SessionState _state = SessionState::Idle;
    std::unique_ptr<Active> _active;
    std::optional<Recording> _lastRecording;
};

} // namespace voxcap
