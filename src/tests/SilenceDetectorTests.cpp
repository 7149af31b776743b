// SPDX-License-Identifier: Apache-2.0
#include <detection/SilenceDetector.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optional>

using namespace voxcap;
using Catch::Approx;

namespace
{

constexpr auto TickMs = std::uint64_t { 100 };

/// Quiet room for the calibration window, five loud ticks from 1500 ms, then quiet again.
auto speechThenSilence(std::uint64_t t) -> double
{
    return (t >= 1500 && t < 2000) ? 0.5 : 0.01;
}

} // namespace

TEST_CASE("SilenceDetector reports calibration until the window closes", "[detector]")
{
    auto detector = SilenceDetector();

    for (auto t = TickMs; t < 1500; t += TickMs)
    {
        auto const result = detector.tick({ .value = 0.01, .elapsedMs = t });
        REQUIRE(result.phase == DetectionPhase::Calibrating);
        REQUIRE(result.thresholds.speech == 0.0);
        REQUIRE_FALSE(result.silenceDetected);
    }
    CHECK_FALSE(detector.isCalibrated());

    auto const closing = detector.tick({ .value = 0.01, .elapsedMs = 1500 });
    CHECK(closing.calibrationCompleted);
    CHECK(closing.phase == DetectionPhase::Detecting);
    CHECK(detector.isCalibrated());
    CHECK(detector.tracker().noiseFloor() == Approx(0.015));
    CHECK(closing.thresholds.speech == Approx(0.06));

    auto const next = detector.tick({ .value = 0.01, .elapsedMs = 1600 });
    CHECK_FALSE(next.calibrationCompleted);
}

TEST_CASE("SilenceDetector ignores speech during calibration", "[detector]")
{
    auto detector = SilenceDetector();

    for (auto t = TickMs; t < 1500; t += TickMs)
        (void) detector.tick({ .value = 0.8, .elapsedMs = t });

    CHECK_FALSE(detector.endpoint().speechConfirmed());
    CHECK(detector.endpoint().state() == EndpointState::AwaitingSpeech);
}

TEST_CASE("SilenceDetector never fires on a silent stream", "[detector]")
{
    auto detector = SilenceDetector();

    for (auto t = TickMs; t <= 60000; t += TickMs)
        REQUIRE_FALSE(detector.tick({ .value = 0.0, .elapsedMs = t }).silenceDetected);

    CHECK_FALSE(detector.endpoint().hasFired());
}

TEST_CASE("SilenceDetector fires once after speech followed by silence", "[detector]")
{
    auto detector = SilenceDetector();

    auto firedAt = std::optional<std::uint64_t> {};
    auto fires = 0;
    auto confirmedAt = std::optional<std::uint64_t> {};

    for (auto t = TickMs; t <= 15000; t += TickMs)
    {
        auto const result = detector.tick({ .value = speechThenSilence(t), .elapsedMs = t });
        if (!confirmedAt && detector.endpoint().speechConfirmed())
            confirmedAt = t;
        if (result.silenceDetected)
        {
            ++fires;
            firedAt = t;
        }
    }

    CHECK(fires == 1);
    REQUIRE(confirmedAt.has_value());
    CHECK(*confirmedAt == 1800);

    REQUIRE(firedAt.has_value());
    // Silence begins at 2000 ms; the averaged level needs a while to fall.
    CHECK(*firedAt >= 2000 + detector.config().silenceDurationMs);
    CHECK(*firedAt >= detector.config().minRecordingDurationMs);
    CHECK(*firedAt == 6300);
}

TEST_CASE("SilenceDetector peak never falls below minPeakLevel", "[detector]")
{
    auto detector = SilenceDetector();

    for (auto t = TickMs; t <= 20000; t += TickMs)
    {
        (void) detector.tick({ .value = speechThenSilence(t), .elapsedMs = t });
        REQUIRE(detector.tracker().peakSpeechLevel() >= detector.config().minPeakLevel);
    }
}
