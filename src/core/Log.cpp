// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <utility>

namespace voxcap::log
{

namespace
{
    // Timer threads and the capture callback log concurrently with the caller.
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto sinkMutex = std::mutex {};
    auto const processStart = std::chrono::steady_clock::now();

    struct LevelInfo
    {
        Level level;
        std::string_view name;
        std::string_view tag;
    };

    constexpr auto Levels = std::array<LevelInfo, 5> { {
        { Level::Error, "error", "ERROR" },
        { Level::Warning, "warning", "WARN " },
        { Level::Info, "info", "INFO " },
        { Level::Debug, "debug", "DEBUG" },
        { Level::Trace, "trace", "TRACE" },
    } };

    auto find(Level level) -> const LevelInfo&
    {
        return Levels[std::min(static_cast<std::size_t>(level), Levels.size() - 1)];
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(sinkMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto levelName(Level level) -> std::string_view
{
    return find(level).name;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto const it = std::ranges::find(Levels, name, &LevelInfo::name);
    if (it != Levels.end())
        return it->level;
    if (name == "warn")
        return Level::Warning;
    return std::nullopt;
}

auto raisedBy(Level base, int verbosity) -> Level
{
    auto const raised = static_cast<int>(base) + std::max(verbosity, 0);
    return static_cast<Level>(std::min(raised, static_cast<int>(Level::Trace)));
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto lock = std::lock_guard(sinkMutex);
    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - processStart);
    std::println(stderr, "[{:9.3f}] [{}] {}", uptime.count(), find(level).tag, message);
}

} // namespace voxcap::log
