// SPDX-License-Identifier: Apache-2.0
#include "WavEncoder.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cstring>

namespace voxcap
{

struct WavEncoder::Impl
{
    ma_encoder encoder {};
    std::vector<std::uint8_t> buffer;
    std::size_t cursor = 0;
    std::atomic<std::size_t> size { 0 };
    std::vector<std::int16_t> scratch;
    std::uint32_t channels = 1;
    bool active = false;

    void reset()
    {
        buffer.clear();
        cursor = 0;
        size = 0;
    }
};

namespace
{

    auto onWrite(ma_encoder* encoder, const void* data, size_t bytesToWrite, size_t* bytesWritten) -> ma_result
    {
        auto* impl = static_cast<WavEncoder::Impl*>(encoder->pUserData);
        auto const end = impl->cursor + bytesToWrite;
        if (end > impl->buffer.size())
            impl->buffer.resize(end);

        std::memcpy(impl->buffer.data() + impl->cursor, data, bytesToWrite);
        impl->cursor = end;
        impl->size.store(impl->buffer.size(), std::memory_order_relaxed);

        if (bytesWritten)
            *bytesWritten = bytesToWrite;
        return MA_SUCCESS;
    }

    auto onSeek(ma_encoder* encoder, ma_int64 offset, ma_seek_origin origin) -> ma_result
    {
        auto* impl = static_cast<WavEncoder::Impl*>(encoder->pUserData);

        auto base = ma_int64 { 0 };
        if (origin == ma_seek_origin_current)
            base = static_cast<ma_int64>(impl->cursor);
        else if (origin == ma_seek_origin_end)
            base = static_cast<ma_int64>(impl->buffer.size());

        auto const target = base + offset;
        if (target < 0 || target > static_cast<ma_int64>(impl->buffer.size()))
            return MA_INVALID_ARGS;

        impl->cursor = static_cast<std::size_t>(target);
        return MA_SUCCESS;
    }

} // namespace

WavEncoder::WavEncoder(): _impl(std::make_unique<Impl>())
{
}

WavEncoder::~WavEncoder()
{
    discard();
}

auto WavEncoder::begin(std::uint32_t sampleRate, std::uint32_t channels) -> VoidResult
{
    discard();

    auto const config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, channels, sampleRate);
    auto const result = ma_encoder_init(onWrite, onSeek, _impl.get(), &config, &_impl->encoder);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::EncoderError,
                         std::format("Failed to initialize WAV encoder: {}", static_cast<int>(result)));

    _impl->channels = channels;
    _impl->active = true;
    log::debug("WAV encoder started ({} Hz, {} ch, s16)", sampleRate, channels);
    return {};
}

auto WavEncoder::write(std::span<const float> samples) -> VoidResult
{
    if (!_impl->active)
        return makeError(ErrorCode::EncoderError, "WAV encoder not started");

    _impl->scratch.resize(samples.size());
    ma_pcm_f32_to_s16(_impl->scratch.data(), samples.data(), samples.size(), ma_dither_mode_none);

    auto const frameCount = static_cast<ma_uint64>(samples.size() / _impl->channels);
    auto framesWritten = ma_uint64 { 0 };
    auto const result =
        ma_encoder_write_pcm_frames(&_impl->encoder, _impl->scratch.data(), frameCount, &framesWritten);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::EncoderError,
                         std::format("Failed to write PCM frames: {}", static_cast<int>(result)));

    return {};
}

auto WavEncoder::finish() -> Result<std::vector<std::uint8_t>>
{
    if (!_impl->active)
        return makeError(ErrorCode::EncoderError, "WAV encoder not started");

    // Uninit rewrites the RIFF and data chunk sizes through the seek callback.
    ma_encoder_uninit(&_impl->encoder);
    _impl->active = false;

    auto bytes = std::move(_impl->buffer);
    _impl->reset();
    return bytes;
}

void WavEncoder::discard()
{
    if (_impl->active)
    {
        ma_encoder_uninit(&_impl->encoder);
        _impl->active = false;
    }
    _impl->reset();
}

auto WavEncoder::size() const noexcept -> std::size_t
{
    return _impl->size.load(std::memory_order_relaxed);
}

auto WavEncoder::isActive() const noexcept -> bool
{
    return _impl->active;
}

} // namespace voxcap
