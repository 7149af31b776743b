// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace voxcap
{

/// @brief Frequency-bin magnitudes of one analyser snapshot, 0..255 per bin.
using SpectrumFrame = std::vector<std::uint8_t>;

/// @brief Capability that exposes the current magnitude spectrum of a live input.
class SpectrumSource
{
  public:
    virtual ~SpectrumSource() = default;

    /// @brief Returns the current spectrum without blocking.
    /// @return The snapshot, or std::nullopt if no spectrum is available right now.
    [[nodiscard]] virtual auto readSpectrum() -> std::optional<SpectrumFrame> = 0;
};

/// @brief Reduces a magnitude spectrum to a normalized RMS loudness in [0, 1].
///
/// Returns 0 for an empty snapshot.
[[nodiscard]] auto computeLoudness(std::span<const std::uint8_t> bins) noexcept -> double;

/// @brief Samples a SpectrumSource once per tick.
class EnergySampler
{
  public:
    explicit EnergySampler(SpectrumSource& source);

    /// @brief Reads the source and reduces it to one loudness sample.
    /// @param elapsedMs Session age to stamp on the sample.
    /// @return The sample, or std::nullopt when the source has no spectrum (skip the tick).
    [[nodiscard]] auto sample(std::uint64_t elapsedMs) -> std::optional<LoudnessSample>;

  private:
    SpectrumSource& _source;
};

} // namespace voxcap
