// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voxcap
{

/// @brief One normalized loudness reading produced per detection tick.
struct LoudnessSample
{
    double value = 0.0;           ///< RMS energy of the spectrum snapshot, 0..1.
    std::uint64_t elapsedMs = 0;  ///< Milliseconds since the session started.
};

/// @brief Lifecycle state of a recording session.
enum class SessionState : std::uint8_t
{
    Idle,
    Calibrating,
    Listening,
    Stopping,
    Finalized,
};

/// @brief Why a session ended.
enum class StopReason : std::uint8_t
{
    Manual,
    SilenceDetected,
    MaxDuration,
    SizeLimit,
    DeviceLost,
};

[[nodiscard]] constexpr auto sessionStateName(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Idle: return "idle";
        case SessionState::Calibrating: return "calibrating";
        case SessionState::Listening: return "listening";
        case SessionState::Stopping: return "stopping";
        case SessionState::Finalized: return "finalized";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto stopReasonName(StopReason reason) -> std::string_view
{
    switch (reason)
    {
        case StopReason::Manual: return "manual";
        case StopReason::SilenceDetected: return "silence";
        case StopReason::MaxDuration: return "max-duration";
        case StopReason::SizeLimit: return "size-limit";
        case StopReason::DeviceLost: return "device-lost";
    }
    return "unknown";
}

/// @brief A finished capture, handed to the transcription boundary as-is.
///
/// The engine never interprets the bytes.
struct Recording
{
    std::vector<std::uint8_t> bytes;
    std::string mimeType;
    std::chrono::milliseconds duration { 0 };
    StopReason reason = StopReason::Manual;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return bytes.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return bytes.empty(); }
};

} // namespace voxcap
