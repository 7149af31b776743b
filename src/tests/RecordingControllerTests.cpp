// SPDX-License-Identifier: Apache-2.0
#include "FakeCaptureDevice.hpp"

#include <session/PeriodicTimer.hpp>
#include <session/RecordingController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

using namespace voxcap;
using namespace std::chrono_literals;
using voxcap::test::FakeCaptureDevice;

namespace
{

/// Polls predicate every 10 ms until it holds or the timeout expires.
auto waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 3s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

auto fastOptions() -> RecordingOptions
{
    auto options = RecordingOptions {};
    options.detection.checkIntervalMs = 10;
    return options;
}

} // namespace

TEST_CASE("PeriodicTimer fires repeatedly until stopped", "[timer]")
{
    auto fires = std::atomic<int> { 0 };
    auto timer = PeriodicTimer("test", 5ms, [&] {
        ++fires;
        return true;
    });

    REQUIRE(waitFor([&] { return fires >= 3; }));
    CHECK(timer.isRunning());

    timer.stop();
    CHECK_FALSE(timer.isRunning());

    auto const afterStop = fires.load();
    std::this_thread::sleep_for(50ms);
    CHECK(fires == afterStop);
    CHECK(timer.fireCount() == static_cast<std::size_t>(afterStop));
}

TEST_CASE("PeriodicTimer ends itself when the callback returns false", "[timer]")
{
    auto fires = std::atomic<int> { 0 };
    auto timer = PeriodicTimer("once", 5ms, [&] {
        ++fires;
        return false;
    });

    REQUIRE(waitFor([&] { return !timer.isRunning(); }));
    std::this_thread::sleep_for(30ms);
    CHECK(fires == 1);
}

TEST_CASE("RecordingController runs timers only while capturing", "[controller]")
{
    auto device = std::make_unique<FakeCaptureDevice>();
    auto* fake = device.get();
    auto controller = RecordingController(std::move(device));

    CHECK_FALSE(controller.timersRunning());
    REQUIRE(controller.start(fastOptions()));
    CHECK(controller.timersRunning());

    // Calibration completes after 1500 ms of session time.
    REQUIRE(waitFor([&] { return controller.state() == SessionState::Listening; }));

    auto const recording = controller.stop();
    REQUIRE(recording);
    CHECK(recording->reason == StopReason::Manual);
    CHECK_FALSE(controller.timersRunning());
    CHECK(controller.state() == SessionState::Idle);
    CHECK(fake->finishCount == 1);
}

TEST_CASE("RecordingController failed start creates no timers", "[controller]")
{
    auto device = std::make_unique<FakeCaptureDevice>();
    device->failOpen = true;
    auto controller = RecordingController(std::move(device));

    auto const started = controller.start(fastOptions());
    REQUIRE_FALSE(started);
    CHECK(started.error().code == ErrorCode::DeviceUnavailable);
    CHECK_FALSE(controller.timersRunning());
    CHECK(controller.state() == SessionState::Idle);
}

TEST_CASE("RecordingController timers end after a self-stop", "[controller]")
{
    auto device = std::make_unique<FakeCaptureDevice>();
    auto* fake = device.get();
    auto lost = std::atomic<int> { 0 };
    auto controller = RecordingController(std::move(device), SessionEvents { .onDeviceLost = [&](const Error&) { ++lost; } });

    REQUIRE(controller.start(fastOptions()));
    fake->connected = false;

    REQUIRE(waitFor([&] { return controller.state() == SessionState::Idle; }));
    REQUIRE(waitFor([&] { return !controller.timersRunning(); }));
    CHECK(lost == 1);

    // stop() after a self-stop hands out the finalized recording.
    auto const recording = controller.stop();
    REQUIRE(recording);
    CHECK(recording->reason == StopReason::DeviceLost);
    CHECK(fake->finishCount == 1);
}

TEST_CASE("RecordingController can start a new session after stopping", "[controller]")
{
    auto device = std::make_unique<FakeCaptureDevice>();
    auto* fake = device.get();
    auto controller = RecordingController(std::move(device));

    REQUIRE(controller.start(fastOptions()));
    REQUIRE(controller.stop());

    REQUIRE(controller.start(fastOptions()));
    CHECK(controller.timersRunning());
    CHECK(controller.status().silenceDetectionActive);
    REQUIRE(controller.stop());
    CHECK(fake->openCount == 2);
    CHECK(fake->finishCount == 2);
}

TEST_CASE("RecordingController stop without a session is an error", "[controller]")
{
    auto controller = RecordingController(std::make_unique<FakeCaptureDevice>());

    auto const stopped = controller.stop();
    REQUIRE_FALSE(stopped);
    CHECK(stopped.error().code == ErrorCode::InvalidState);
}
