// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <session/CaptureDevice.hpp>
#include <session/RecordingOptions.hpp>
#include <session/RecordingSession.hpp>

#include <memory>

namespace voxcap
{

/// @brief Drives a RecordingSession from two independent periodic timers.
///
/// The detection timer samples the device and advances silence detection; the duration
/// timer enforces the duration, size and device-loss limits. Both run every
/// checkIntervalMs, are serialized on one mutex, and exist only while a session captures.
///
/// start() and stop() must not be called from inside SessionEvents callbacks.
class RecordingController
{
  public:
    explicit RecordingController(std::unique_ptr<CaptureDevice> device, SessionEvents events = {});
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    /// @brief Starts a session and its timers.
    /// @return Success or the session's start error. No timer runs after a failed start.
    [[nodiscard]] auto start(const RecordingOptions& options) -> VoidResult;

    /// @brief Stops the timers, then the session.
    ///
    /// Idempotent. Once this returns no timer callback fires anymore.
    [[nodiscard]] auto stop() -> Result<Recording>;

    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto status() const -> SessionStatus;

    /// @brief True while at least one session timer thread is alive.
    [[nodiscard]] auto timersRunning() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voxcap
