// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <session/CaptureDevice.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voxcap
{

/// @brief Microphone capture through miniaudio, encoded to WAV in memory.
///
/// Captures float32 PCM at 16kHz mono. Audio arrives on miniaudio's device thread and is fed
/// to the encoder and, once attached, to the spectrum analyser; both are guarded by one mutex
/// shared with readSpectrum() and finish().
class AudioCapture final: public CaptureDevice
{
  public:
    static constexpr auto SampleRate = 16000u;

    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    [[nodiscard]] auto open(std::string_view deviceName) -> VoidResult override;
    [[nodiscard]] auto attachAnalyser(const SilenceDetectionConfig& config) -> VoidResult override;
    [[nodiscard]] auto readSpectrum() -> std::optional<SpectrumFrame> override;
    [[nodiscard]] auto encodedBytes() const -> std::size_t override;
    [[nodiscard]] auto isConnected() const -> bool override;
    [[nodiscard]] auto finish() -> Result<std::vector<std::uint8_t>> override;
    void abort() override;
    [[nodiscard]] auto mimeType() const -> std::string override;

    /// @brief Names of the available capture devices.
    [[nodiscard]] static auto listDevices() -> Result<std::vector<std::string>>;

    // Impl must be accessible from the C audio callbacks
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voxcap
