// SPDX-License-Identifier: Apache-2.0
#include "StopKey.hpp"

#include <core/Log.hpp>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace voxcap
{

auto waitForStopKey(int fd, std::chrono::milliseconds timeout) -> StopKeyEvent
{
    auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
    auto const ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0)
    {
        if (errno == EINTR)
            return StopKeyEvent::Timeout;
        log::debug("Stop key input unusable: {}", std::strerror(errno));
        return StopKeyEvent::Closed;
    }
    if (ready == 0)
        return StopKeyEvent::Timeout;

    // POLLHUP may come together with buffered input, which is still read first.
    if (!(pfd.revents & POLLIN))
        return StopKeyEvent::Closed;

    char buffer[256];
    auto const n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0)
        return StopKeyEvent::Pressed;
    if (n < 0 && errno == EINTR)
        return StopKeyEvent::Timeout;
    return StopKeyEvent::Closed;
}

} // namespace voxcap
