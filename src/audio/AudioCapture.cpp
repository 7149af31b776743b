// SPDX-License-Identifier: Apache-2.0
#include "AudioCapture.hpp"

#include <audio/SpectrumAnalyser.hpp>
#include <audio/WavEncoder.hpp>
#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <optional>
#include <string>

namespace voxcap
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool deviceInitialized = false;

    std::atomic<bool> capturing { false };
    std::atomic<bool> connected { true };
    std::atomic<bool> encodeFailed { false };

    std::mutex mutex; // guards encoder and analyser
    WavEncoder encoder;
    std::unique_ptr<SpectrumAnalyser> analyser;

    /// @brief Stops the device and releases all miniaudio handles. Idempotent.
    void release()
    {
        capturing = false;
        // Uninit waits for the device thread, which takes the mutex; never hold it here.
        if (deviceInitialized)
        {
            ma_device_uninit(&device);
            deviceInitialized = false;
        }
        if (contextInitialized)
        {
            ma_context_uninit(&context);
            contextInitialized = false;
        }
    }
};

namespace
{

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !input || !impl->capturing.load(std::memory_order_relaxed))
            return;

        auto const samples = std::span<const float>(static_cast<const float*>(input), frameCount);

        auto lock = std::lock_guard(impl->mutex);
        if (impl->encoder.isActive() && !impl->encoder.write(samples))
            impl->encodeFailed.store(true, std::memory_order_relaxed);
        if (impl->analyser)
            impl->analyser->push(samples);
    }

    void deviceNotificationCallback(const ma_device_notification* notification)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(notification->pDevice->pUserData);
        if (!impl)
            return;

        // A stop we did not ask for means the input went away.
        if (notification->type == ma_device_notification_type_stopped && impl->capturing.load())
            impl->connected = false;
    }

    /// @brief Picks a capture device: name filter first, then the first non-monitor source.
    auto selectDevice(ma_context& context, std::string_view deviceName) -> std::optional<ma_device_id>
    {
        ma_device_info* captureDevices = nullptr;
        auto captureCount = ma_uint32 { 0 };
        auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);
        if (enumResult != MA_SUCCESS)
        {
            log::warning("Failed to enumerate capture devices (code: {}), using default",
                         static_cast<int>(enumResult));
            return std::nullopt;
        }

        if (!deviceName.empty())
        {
            auto const target = toLower(std::string(deviceName));
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(captureDevices[i].name).find(target) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", captureDevices[i].name, deviceName);
                    return captureDevices[i].id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitor sources are loopbacks, not microphones.
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        {
            if (!toLower(captureDevices[i].name).starts_with("monitor"))
                return captureDevices[i].id;
        }
        return std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    abort();
}

auto AudioCapture::open(std::string_view deviceName) -> VoidResult
{
    if (_impl->deviceInitialized)
        return makeError(ErrorCode::InvalidState, "Audio capture already open");

    _impl->connected = true;
    _impl->encodeFailed = false;

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    auto const deviceId = selectDevice(_impl->context, deviceName);

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = SampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.notificationCallback = deviceNotificationCallback;
    deviceConfig.pUserData = _impl.get();
    if (deviceId)
        deviceConfig.capture.pDeviceID = &*deviceId;

    auto const initResult = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (initResult != MA_SUCCESS)
    {
        _impl->release();
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(initResult)));
    }
    _impl->deviceInitialized = true;

    auto begun = [&] {
        auto lock = std::lock_guard(_impl->mutex);
        return _impl->encoder.begin(SampleRate, 1);
    }();
    if (!begun)
    {
        _impl->release();
        return begun;
    }

    _impl->capturing = true;
    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        _impl->release();
        auto lock = std::lock_guard(_impl->mutex);
        _impl->encoder.discard();
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to start audio capture: {}", static_cast<int>(startResult)));
    }

    log::info("Audio capture started on '{}' (16kHz, mono, float32)", _impl->device.capture.name);
    return {};
}

auto AudioCapture::attachAnalyser(const SilenceDetectionConfig& config) -> VoidResult
{
    if (!_impl->deviceInitialized)
        return makeError(ErrorCode::DetectionSetupFailed, "Audio capture not open");

    auto analyser = SpectrumAnalyser::create(config.fftSize, config.smoothingTimeConstant);
    if (!analyser)
        return std::unexpected(analyser.error());

    auto lock = std::lock_guard(_impl->mutex);
    _impl->analyser = std::move(*analyser);
    return {};
}

auto AudioCapture::readSpectrum() -> std::optional<SpectrumFrame>
{
    if (!_impl->capturing || !_impl->connected)
        return std::nullopt;

    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->analyser)
        return std::nullopt;
    return _impl->analyser->byteFrequencyData();
}

auto AudioCapture::encodedBytes() const -> std::size_t
{
    return _impl->encoder.size();
}

auto AudioCapture::isConnected() const -> bool
{
    return _impl->connected;
}

auto AudioCapture::finish() -> Result<std::vector<std::uint8_t>>
{
    _impl->release();

    auto lock = std::lock_guard(_impl->mutex);
    _impl->analyser.reset();
    if (_impl->encodeFailed)
        log::warning("Some audio frames could not be encoded");

    auto bytes = _impl->encoder.finish();
    if (bytes)
        log::info("Audio capture stopped ({} bytes)", bytes->size());
    return bytes;
}

void AudioCapture::abort()
{
    _impl->release();

    auto lock = std::lock_guard(_impl->mutex);
    _impl->analyser.reset();
    _impl->encoder.discard();
}

auto AudioCapture::mimeType() const -> std::string
{
    return "audio/wav";
}

auto AudioCapture::listDevices() -> Result<std::vector<std::string>>
{
    auto context = ma_context {};
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);

    auto names = std::vector<std::string> {};
    if (enumResult == MA_SUCCESS)
    {
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            names.emplace_back(captureDevices[i].name);
    }
    ma_context_uninit(&context);

    if (enumResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to enumerate capture devices: {}", static_cast<int>(enumResult)));
    return names;
}

} // namespace voxcap
