// SPDX-License-Identifier: Apache-2.0
#include "SpectrumAnalyser.hpp"

#include <core/Log.hpp>

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace voxcap
{

struct SpectrumAnalyser::Impl
{
    std::size_t fftSize = 0;
    double smoothing = 0.0;

    float* input = nullptr;
    fftwf_complex* output = nullptr;
    fftwf_plan plan = nullptr;

    std::vector<float> window;   // Blackman coefficients
    std::vector<float> ring;     // last fftSize samples
    std::size_t writePos = 0;
    std::vector<double> smoothed; // previous magnitudes per bin

    ~Impl()
    {
        if (plan)
            fftwf_destroy_plan(plan);
        if (output)
            fftwf_free(output);
        if (input)
            fftwf_free(input);
    }
};

auto SpectrumAnalyser::create(std::uint32_t fftSize, double smoothingTimeConstant)
    -> Result<std::unique_ptr<SpectrumAnalyser>>
{
    if (fftSize < 32 || (fftSize & (fftSize - 1)) != 0)
        return makeError(ErrorCode::DetectionSetupFailed, std::format("Invalid FFT size {}", fftSize));

    auto impl = std::make_unique<Impl>();
    impl->fftSize = fftSize;
    impl->smoothing = std::clamp(smoothingTimeConstant, 0.0, 0.999);

    impl->input = fftwf_alloc_real(fftSize);
    impl->output = fftwf_alloc_complex(fftSize / 2 + 1);
    if (!impl->input || !impl->output)
        return makeError(ErrorCode::DetectionSetupFailed, "Failed to allocate FFT buffers");

    impl->plan = fftwf_plan_dft_r2c_1d(static_cast<int>(fftSize), impl->input, impl->output, FFTW_ESTIMATE);
    if (!impl->plan)
        return makeError(ErrorCode::DetectionSetupFailed, "Failed to create FFT plan");

    constexpr auto alpha = 0.16;
    constexpr auto a0 = 0.5 * (1.0 - alpha);
    constexpr auto a1 = 0.5;
    constexpr auto a2 = 0.5 * alpha;
    impl->window.resize(fftSize);
    for (auto i = std::size_t { 0 }; i < fftSize; ++i)
    {
        auto const x = static_cast<double>(i) / static_cast<double>(fftSize);
        impl->window[i] = static_cast<float>(a0 - a1 * std::cos(2.0 * std::numbers::pi * x)
                                             + a2 * std::cos(4.0 * std::numbers::pi * x));
    }

    impl->ring.assign(fftSize, 0.0f);
    impl->smoothed.assign(fftSize / 2, 0.0);

    log::debug("Spectrum analyser ready (fft {}, smoothing {:.2f})", fftSize, impl->smoothing);
    return std::unique_ptr<SpectrumAnalyser>(new SpectrumAnalyser(std::move(impl)));
}

SpectrumAnalyser::SpectrumAnalyser(std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

SpectrumAnalyser::~SpectrumAnalyser() = default;

void SpectrumAnalyser::push(std::span<const float> samples)
{
    auto& ring = _impl->ring;
    for (auto const sample: samples)
    {
        ring[_impl->writePos] = sample;
        _impl->writePos = (_impl->writePos + 1) % ring.size();
    }
}

auto SpectrumAnalyser::byteFrequencyData() -> SpectrumFrame
{
    auto const n = _impl->fftSize;

    // Oldest sample first, so the window lines up with time.
    for (auto i = std::size_t { 0 }; i < n; ++i)
        _impl->input[i] = _impl->ring[(_impl->writePos + i) % n] * _impl->window[i];

    fftwf_execute(_impl->plan);

    constexpr auto range = MaxDecibels - MinDecibels;
    auto frame = SpectrumFrame(binCount());
    for (auto k = std::size_t { 0 }; k < frame.size(); ++k)
    {
        auto const re = static_cast<double>(_impl->output[k][0]);
        auto const im = static_cast<double>(_impl->output[k][1]);
        auto const magnitude = std::sqrt(re * re + im * im) / static_cast<double>(n);

        auto& smoothed = _impl->smoothed[k];
        smoothed = _impl->smoothing * smoothed + (1.0 - _impl->smoothing) * magnitude;

        auto const db = smoothed > 0.0 ? 20.0 * std::log10(smoothed) : MinDecibels;
        auto const scaled = 255.0 * (db - MinDecibels) / range;
        frame[k] = static_cast<std::uint8_t>(std::clamp(scaled, 0.0, 255.0));
    }
    return frame;
}

auto SpectrumAnalyser::binCount() const noexcept -> std::size_t
{
    return _impl->fftSize / 2;
}

} // namespace voxcap
