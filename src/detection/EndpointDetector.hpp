// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <detection/AdaptiveThresholdTracker.hpp>
#include <detection/SilenceDetectionConfig.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace voxcap
{

/// @brief Observable phase of the endpoint detector.
enum class EndpointState : std::uint8_t
{
    AwaitingSpeech,
    SpeechConfirmed,
    SilenceAccumulating,
    SilenceTriggered,
};

[[nodiscard]] constexpr auto endpointStateName(EndpointState state) -> std::string_view
{
    switch (state)
    {
        case EndpointState::AwaitingSpeech: return "awaiting-speech";
        case EndpointState::SpeechConfirmed: return "speech-confirmed";
        case EndpointState::SilenceAccumulating: return "silence-accumulating";
        case EndpointState::SilenceTriggered: return "silence-triggered";
    }
    return "unknown";
}

/// @brief Hysteresis counters advanced once per tick.
///
/// consecutiveSpeech and consecutiveSilence are never both non-zero.
struct HysteresisCounters
{
    std::uint32_t consecutiveSpeech = 0;
    std::uint32_t consecutiveSilence = 0;
    bool speechConfirmed = false;
    std::optional<std::uint64_t> silenceStartedAtMs;
};

/// @brief Debounced double-threshold comparator that detects the end of an utterance.
///
/// Reports "silence detected" once speech has been confirmed and the moving-averaged loudness
/// then stayed below the silence threshold for silenceDurationMs. The event fires at most once.
class EndpointDetector
{
  public:
    explicit EndpointDetector(const SilenceDetectionConfig& config);

    /// @brief Advances the state machine by one tick.
    /// @param average Moving-averaged loudness.
    /// @param thresholds Thresholds in effect for this tick.
    /// @param elapsedMs Session age of this tick.
    /// @return True exactly once, on the tick the silence event fires.
    [[nodiscard]] auto update(double average, const Thresholds& thresholds, std::uint64_t elapsedMs) -> bool;

    /// @brief Drops any pending silence timer (used while calibrating).
    void clearSilenceTimer() noexcept { _counters.silenceStartedAtMs.reset(); }

    /// @brief Returns to the initial state for a new session.
    void reset() noexcept;

    [[nodiscard]] auto state() const noexcept -> EndpointState;
    [[nodiscard]] auto counters() const noexcept -> const HysteresisCounters& { return _counters; }
    [[nodiscard]] auto speechConfirmed() const noexcept -> bool { return _counters.speechConfirmed; }
    [[nodiscard]] auto hasFired() const noexcept -> bool { return _fired; }

  private:
    void onSilentTick(std::uint64_t elapsedMs);
    void onAmbientTick();

    SilenceDetectionConfig _config;
    HysteresisCounters _counters;
    bool _fired = false;
    bool _firedThisTick = false;
};

} // namespace voxcap
