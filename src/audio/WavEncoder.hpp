// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace voxcap
{

/// @brief Encodes float PCM into an in-memory 16-bit WAV stream using miniaudio.
///
/// Not thread-safe; the owner serializes write() against finish().
class WavEncoder
{
  public:
    WavEncoder();
    ~WavEncoder();

    WavEncoder(const WavEncoder&) = delete;
    WavEncoder& operator=(const WavEncoder&) = delete;

    /// @brief Starts a new stream, discarding any previous one.
    [[nodiscard]] auto begin(std::uint32_t sampleRate, std::uint32_t channels) -> VoidResult;

    /// @brief Appends interleaved float frames in [-1, 1].
    [[nodiscard]] auto write(std::span<const float> samples) -> VoidResult;

    /// @brief Completes the header and returns the whole stream.
    [[nodiscard]] auto finish() -> Result<std::vector<std::uint8_t>>;

    /// @brief Drops the current stream.
    void discard();

    /// @brief Bytes written so far. Safe to call from any thread.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto isActive() const noexcept -> bool;

    // Impl must be accessible from the miniaudio write/seek callbacks
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voxcap
