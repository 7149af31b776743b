// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <session/CaptureDevice.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace voxcap::test
{

/// @brief Capture device for tests: a constant spectrum and a scripted byte stream.
class FakeCaptureDevice: public CaptureDevice
{
  public:
    static constexpr auto BinCount = std::size_t { 128 };

    std::atomic<bool> failOpen { false };
    std::atomic<bool> failAnalyser { false };
    std::atomic<bool> failFinish { false };
    std::atomic<bool> connected { true };
    std::atomic<std::size_t> bytes { 0 };

    std::atomic<int> openCount { 0 };
    std::atomic<int> finishCount { 0 };
    std::atomic<int> abortCount { 0 };
    std::atomic<bool> isOpen { false };

    /// @brief Makes every bin read `level`, i.e. a loudness of level / 255.
    void setLevel(std::uint8_t level)
    {
        auto lock = std::lock_guard(_mutex);
        _spectrum = SpectrumFrame(BinCount, level);
    }

    /// @brief Makes readSpectrum() report "no spectrum".
    void setUnavailable()
    {
        auto lock = std::lock_guard(_mutex);
        _spectrum.reset();
    }

    auto open(std::string_view /*deviceName*/) -> VoidResult override
    {
        ++openCount;
        if (failOpen)
            return makeError(ErrorCode::DeviceUnavailable, "Permission denied");
        isOpen = true;
        return {};
    }

    auto attachAnalyser(const SilenceDetectionConfig& /*config*/) -> VoidResult override
    {
        if (failAnalyser)
            return makeError(ErrorCode::DetectionSetupFailed, "No analyser");
        return {};
    }

    auto readSpectrum() -> std::optional<SpectrumFrame> override
    {
        auto lock = std::lock_guard(_mutex);
        if (!isOpen)
            return std::nullopt;
        return _spectrum;
    }

    auto encodedBytes() const -> std::size_t override { return bytes; }

    auto isConnected() const -> bool override { return connected; }

    auto finish() -> Result<std::vector<std::uint8_t>> override
    {
        ++finishCount;
        isOpen = false;
        if (failFinish)
            return makeError(ErrorCode::EncoderError, "Encoder failed");
        return std::vector<std::uint8_t> { 'R', 'I', 'F', 'F' };
    }

    void abort() override
    {
        ++abortCount;
        isOpen = false;
    }

    auto mimeType() const -> std::string override { return "audio/wav"; }

  private:
    std::mutex _mutex;
    std::optional<SpectrumFrame> _spectrum = SpectrumFrame(BinCount, 0);
};

/// @brief Hand-advanced steady clock.
struct ManualClock
{
    std::chrono::steady_clock::time_point now {};

    void advance(std::chrono::milliseconds delta) { now += delta; }
};

} // namespace voxcap::test
