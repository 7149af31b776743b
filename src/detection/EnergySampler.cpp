// SPDX-License-Identifier: Apache-2.0
#include "EnergySampler.hpp"

#include <algorithm>
#include <cmath>

namespace voxcap
{

auto computeLoudness(std::span<const std::uint8_t> bins) noexcept -> double
{
    if (bins.empty())
        return 0.0;

    auto sum = 0.0;
    for (auto const bin: bins)
        sum += static_cast<double>(bin) * static_cast<double>(bin);

    auto const rms = std::sqrt(sum / static_cast<double>(bins.size())) / 255.0;
    return std::clamp(rms, 0.0, 1.0);
}

EnergySampler::EnergySampler(SpectrumSource& source): _source(source)
{
}

auto EnergySampler::sample(std::uint64_t elapsedMs) -> std::optional<LoudnessSample>
{
    auto const spectrum = _source.readSpectrum();
    if (!spectrum)
        return std::nullopt;

    return LoudnessSample { .value = computeLoudness(*spectrum), .elapsedMs = elapsedMs };
}

} // namespace voxcap
