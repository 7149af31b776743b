// SPDX-License-Identifier: Apache-2.0
#include <voxcap/StopKey.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include <fcntl.h>
#include <unistd.h>

using namespace voxcap;
using namespace std::chrono_literals;

namespace
{

/// Both ends of a pipe, closed on scope exit.
struct Pipe
{
    int readEnd = -1;
    int writeEnd = -1;

    Pipe()
    {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        readEnd = fds[0];
        writeEnd = fds[1];
    }

    ~Pipe()
    {
        closeWriter();
        if (readEnd >= 0)
            ::close(readEnd);
    }

    void closeWriter()
    {
        if (writeEnd >= 0)
            ::close(writeEnd);
        writeEnd = -1;
    }
};

} // namespace

TEST_CASE("waitForStopKey times out while nothing is typed", "[stopkey]")
{
    auto pipe = Pipe {};
    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Timeout);
}

TEST_CASE("waitForStopKey reports Enter and consumes the line", "[stopkey]")
{
    auto pipe = Pipe {};
    REQUIRE(::write(pipe.writeEnd, "\n", 1) == 1);

    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Pressed);
    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Timeout);
}

TEST_CASE("waitForStopKey treats /dev/null as closed, not as a key press", "[stopkey]")
{
    auto const fd = ::open("/dev/null", O_RDONLY);
    REQUIRE(fd >= 0);

    CHECK(waitForStopKey(fd, 10ms) == StopKeyEvent::Closed);
    ::close(fd);
}

TEST_CASE("waitForStopKey reports a pipe whose writer has gone as closed", "[stopkey]")
{
    auto pipe = Pipe {};
    pipe.closeWriter();

    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Closed);
}

TEST_CASE("waitForStopKey reads buffered input before reporting the hangup", "[stopkey]")
{
    auto pipe = Pipe {};
    REQUIRE(::write(pipe.writeEnd, "\n", 1) == 1);
    pipe.closeWriter();

    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Pressed);
    CHECK(waitForStopKey(pipe.readEnd, 10ms) == StopKeyEvent::Closed);
}

TEST_CASE("waitForStopKey reports an invalid descriptor as closed", "[stopkey]")
{
    auto pipe = Pipe {};
    auto const fd = pipe.readEnd;
    ::close(fd);
    pipe.readEnd = -1;

    CHECK(waitForStopKey(fd, 10ms) == StopKeyEvent::Closed);
}
