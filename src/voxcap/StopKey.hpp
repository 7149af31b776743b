// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>

namespace voxcap
{

/// @brief What a single wait on the stop-key input produced.
enum class StopKeyEvent : std::uint8_t
{
    Timeout,  ///< Nothing arrived within the timeout.
    Pressed,  ///< A line (Enter) was read.
    Closed,   ///< End of file, hangup or an unusable descriptor. The input never yields a key again.
};

/// @brief Waits up to @p timeout for a key press on @p fd and consumes what was typed.
///
/// A descriptor at end of file (`/dev/null`, a pipe whose writer has gone) reports Closed
/// instead of Pressed, so a caller without a terminal keeps recording.
[[nodiscard]] auto waitForStopKey(int fd, std::chrono::milliseconds timeout) -> StopKeyEvent;

} // namespace voxcap
