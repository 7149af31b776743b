// SPDX-License-Identifier: Apache-2.0
#include "PeriodicTimer.hpp"

#include <core/Log.hpp>

namespace voxcap
{

PeriodicTimer::PeriodicTimer(std::string name, std::chrono::milliseconds interval, Callback callback):
    _name(std::move(name)),
    _interval(interval),
    _callback(std::move(callback)),
    _thread([this](const std::stop_token& stopToken) { run(stopToken); })
{
}

PeriodicTimer::~PeriodicTimer()
{
    stop();
}

void PeriodicTimer::stop()
{
    _thread.request_stop();
    _cv.notify_all();

    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
        _thread.join();
}

void PeriodicTimer::run(const std::stop_token& stopToken)
{
    log::trace("Timer '{}' started ({} ms)", _name, _interval.count());

    auto next = std::chrono::steady_clock::now() + _interval;
    while (!stopToken.stop_requested())
    {
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait_until(lock, stopToken, next, [] { return false; });
        }

        if (stopToken.stop_requested())
            break;

        ++_fireCount;
        if (!_callback())
            break;

        // Skip ticks missed by a slow callback instead of firing them in a burst.
        auto const now = std::chrono::steady_clock::now();
        next += _interval;
        if (next < now)
            next = now + _interval;
    }

    _running = false;
    log::trace("Timer '{}' stopped after {} ticks", _name, _fireCount.load());
}

} // namespace voxcap
