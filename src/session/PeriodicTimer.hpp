// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace voxcap
{

/// @brief Runs a callback at a fixed cadence on its own thread.
///
/// The callback returns false to end the timer from inside. stop() and the destructor
/// join the thread, so once either returns the callback never runs again.
class PeriodicTimer
{
  public:
    using Callback = std::function<bool()>;

    PeriodicTimer(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    /// @brief Stops the timer and waits for an in-flight callback to return.
    ///
    /// Called from the timer's own callback it only requests the stop.
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool { return _running.load(); }
    [[nodiscard]] auto fireCount() const noexcept -> std::size_t { return _fireCount.load(); }
    [[nodiscard]] auto name() const noexcept -> const std::string& { return _name; }

  private:
    void run(const std::stop_token& stopToken);

    std::string _name;
    std::chrono::milliseconds _interval;
    Callback _callback;
    std::atomic<bool> _running { true };
    std::atomic<std::size_t> _fireCount { 0 };
    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::jthread _thread; // last member: starts after everything it uses
};

} // namespace voxcap
