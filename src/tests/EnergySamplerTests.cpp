// SPDX-License-Identifier: Apache-2.0
#include <detection/EnergySampler.hpp>
#include <detection/MovingAverage.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cmath>

using namespace voxcap;
using Catch::Approx;

namespace
{

class ScriptedSource: public SpectrumSource
{
  public:
    std::optional<SpectrumFrame> next;

    auto readSpectrum() -> std::optional<SpectrumFrame> override { return next; }
};

} // namespace

TEST_CASE("computeLoudness normalizes RMS of bins to 0..1", "[sampler]")
{
    CHECK(computeLoudness(SpectrumFrame(128, 0)) == 0.0);
    CHECK(computeLoudness(SpectrumFrame(128, 255)) == Approx(1.0));
    CHECK(computeLoudness(SpectrumFrame(64, 51)) == Approx(0.2));

    auto const mixed = std::array<std::uint8_t, 2> { 0, 255 };
    CHECK(computeLoudness(mixed) == Approx(std::sqrt(0.5)));
}

TEST_CASE("computeLoudness of an empty spectrum is zero", "[sampler]")
{
    CHECK(computeLoudness({}) == 0.0);
}

TEST_CASE("EnergySampler stamps samples with the session age", "[sampler]")
{
    auto source = ScriptedSource {};
    source.next = SpectrumFrame(16, 255);

    auto sampler = EnergySampler(source);
    auto const sample = sampler.sample(1200);

    REQUIRE(sample.has_value());
    CHECK(sample->value == Approx(1.0));
    CHECK(sample->elapsedMs == 1200);
}

TEST_CASE("EnergySampler skips the tick when no spectrum is available", "[sampler]")
{
    auto source = ScriptedSource {};
    auto sampler = EnergySampler(source);

    // Absence is "no sample", not a silent sample.
    CHECK_FALSE(sampler.sample(100).has_value());
}

TEST_CASE("MovingAverage averages over the most recent window", "[sampler]")
{
    auto average = MovingAverage(3);

    CHECK(average.push(3.0) == Approx(3.0));
    CHECK(average.push(6.0) == Approx(4.5));
    CHECK(average.push(9.0) == Approx(6.0));
    CHECK(average.push(12.0) == Approx(9.0));
    CHECK(average.size() == 3);

    average.clear();
    CHECK(average.average() == 0.0);
}
