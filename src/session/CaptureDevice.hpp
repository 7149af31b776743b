// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <detection/EnergySampler.hpp>
#include <detection/SilenceDetectionConfig.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace voxcap
{

/// @brief Abstract audio input that records into an encoded byte stream.
///
/// A device is opened once per session and then either finished (the encoded stream is
/// returned and all handles are released) or aborted (everything is discarded).
class CaptureDevice: public SpectrumSource
{
  public:
    /// @brief Acquires the input and starts capturing.
    /// @param deviceName Case-insensitive substring of the input name, empty for the default input.
    /// @return Success, or a DeviceUnavailable error (missing device, permission denied).
    [[nodiscard]] virtual auto open(std::string_view deviceName) -> VoidResult = 0;

    /// @brief Attaches a spectrum analyser to the running input.
    /// @return Success, or a DetectionSetupFailed error. Capture continues either way.
    [[nodiscard]] virtual auto attachAnalyser(const SilenceDetectionConfig& config) -> VoidResult = 0;

    /// @brief Number of encoded bytes produced so far.
    [[nodiscard]] virtual auto encodedBytes() const -> std::size_t = 0;

    /// @brief False once the input disappeared while capturing.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Stops capturing, releases the input and returns the complete encoded stream.
    [[nodiscard]] virtual auto finish() -> Result<std::vector<std::uint8_t>> = 0;

    /// @brief Stops capturing and releases the input, discarding anything captured.
    ///
    /// Must be safe to call when the device is not open.
    virtual void abort() = 0;

    /// @brief MIME type of the encoded stream, e.g. "audio/wav".
    [[nodiscard]] virtual auto mimeType() const -> std::string = 0;
};

/// @brief Scoped ownership of an opened CaptureDevice.
///
/// Aborts the device on destruction unless finish() handed the stream over.
class CaptureLease
{
  public:
    explicit CaptureLease(CaptureDevice& device) noexcept: _device(&device) {}

    ~CaptureLease()
    {
        if (_device)
            _device->abort();
    }

    CaptureLease(const CaptureLease&) = delete;
    CaptureLease& operator=(const CaptureLease&) = delete;

    /// @brief Finishes the device and ends the lease.
    [[nodiscard]] auto finish() -> Result<std::vector<std::uint8_t>>
    {
        if (!_device)
            return makeError(ErrorCode::InvalidState, "Capture already released");
        auto* device = std::exchange(_device, nullptr);
        return device->finish();
    }

    [[nodiscard]] auto held() const noexcept -> bool { return _device != nullptr; }

  private:
    CaptureDevice* _device;
};

} // namespace voxcap
