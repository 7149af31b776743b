// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace voxcap::log
{

/// @brief Verbosity level for log messages.
///
/// Trace carries one line per detection tick and is only meant for tuning thresholds.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to a callback instead of stderr. An empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages of this level are currently written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Returns the config-file name of a level ("error", "warning", ...).
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name as written in the config file.
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Raises a base level by a number of -v flags, saturating at Trace.
[[nodiscard]] auto raisedBy(Level base, int verbosity) -> Level;

/// @brief Writes a message at the given level.
///
/// Without a callback the message goes to stderr, prefixed with the seconds since
/// process start and the level, so tick traces can be lined up against each other.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a per-tick message. Formatting is skipped entirely below Trace.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace voxcap::log
