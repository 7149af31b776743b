// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <detection/EnergySampler.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace voxcap
{

/// @brief Byte-scaled magnitude spectrum of the most recent input, computed with FFTW.
///
/// Windows the last fftSize samples with a Blackman window, smooths magnitudes over time,
/// converts them to decibels and maps [minDecibels, maxDecibels] onto 0..255 per bin.
class SpectrumAnalyser
{
  public:
    static constexpr auto MinDecibels = -100.0;
    static constexpr auto MaxDecibels = -30.0;

    /// @brief Creates an analyser.
    /// @param fftSize Power of two, at least 32.
    /// @param smoothingTimeConstant Weight of the previous snapshot, 0 <= value < 1.
    /// @return The analyser, or DetectionSetupFailed if FFTW could not plan the transform.
    [[nodiscard]] static auto create(std::uint32_t fftSize, double smoothingTimeConstant)
        -> Result<std::unique_ptr<SpectrumAnalyser>>;

    ~SpectrumAnalyser();

    SpectrumAnalyser(const SpectrumAnalyser&) = delete;
    SpectrumAnalyser& operator=(const SpectrumAnalyser&) = delete;

    /// @brief Appends mono samples to the analysis window.
    void push(std::span<const float> samples);

    /// @brief Transforms the current window and returns one byte per frequency bin.
    [[nodiscard]] auto byteFrequencyData() -> SpectrumFrame;

    [[nodiscard]] auto binCount() const noexcept -> std::size_t;

  private:
    struct Impl;

    explicit SpectrumAnalyser(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace voxcap
