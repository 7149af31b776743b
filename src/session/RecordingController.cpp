// SPDX-License-Identifier: Apache-2.0
#include "RecordingController.hpp"

#include <core/Log.hpp>
#include <session/PeriodicTimer.hpp>

#include <algorithm>
#include <mutex>
#include <optional>

namespace voxcap
{

struct RecordingController::Impl
{
    std::unique_ptr<CaptureDevice> device;
    mutable std::mutex sessionMutex;
    RecordingSession session;

    mutable std::mutex lifecycleMutex; // serializes start() and stop()
    std::optional<PeriodicTimer> detectionTimer;
    std::optional<PeriodicTimer> durationTimer;

    Impl(std::unique_ptr<CaptureDevice> dev, SessionEvents events):
        device(std::move(dev)), session(*device, std::move(events))
    {
    }

    /// @brief Joins both timers. Must not be called with sessionMutex held.
    void releaseTimers()
    {
        detectionTimer.reset();
        durationTimer.reset();
    }

    void startTimers(std::chrono::milliseconds interval)
    {
        detectionTimer.emplace("detection", interval, [this] {
            auto lock = std::lock_guard(sessionMutex);
            session.onDetectionTick();
            return session.isCapturing();
        });
        durationTimer.emplace("duration", interval, [this] {
            auto lock = std::lock_guard(sessionMutex);
            session.onDurationTick();
            return session.isCapturing();
        });
    }
};

RecordingController::RecordingController(std::unique_ptr<CaptureDevice> device, SessionEvents events):
    _impl(std::make_unique<Impl>(std::move(device), std::move(events)))
{
}

RecordingController::~RecordingController()
{
    _impl->releaseTimers();
}

auto RecordingController::start(const RecordingOptions& options) -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);

    // Timers of a session that stopped itself may still be winding down.
    _impl->releaseTimers();

    auto lock = std::lock_guard(_impl->sessionMutex);
    auto started = _impl->session.start(options);
    if (!started)
        return started;

    auto const interval = std::chrono::milliseconds(std::max(options.detection.checkIntervalMs, 1u));
    _impl->startTimers(interval);
    log::debug("Session timers started ({} ms cadence)", interval.count());
    return {};
}

auto RecordingController::stop() -> Result<Recording>
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    _impl->releaseTimers();

    auto lock = std::lock_guard(_impl->sessionMutex);
    return _impl->session.stop();
}

auto RecordingController::state() const -> SessionState
{
    auto lock = std::lock_guard(_impl->sessionMutex);
    return _impl->session.state();
}

auto RecordingController::status() const -> SessionStatus
{
    auto lock = std::lock_guard(_impl->sessionMutex);
    return _impl->session.status();
}

auto RecordingController::timersRunning() const -> bool
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    auto const alive = [](const std::optional<PeriodicTimer>& timer) { return timer && timer->isRunning(); };
    return alive(_impl->detectionTimer) || alive(_impl->durationTimer);
}

} // namespace voxcap
