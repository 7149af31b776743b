// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <session/RecordingController.hpp>
#include <voxcap/Config.hpp>
#include <voxcap/StopKey.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <thread>

#include <unistd.h>

namespace
{

std::atomic<bool> interruptRequested { false };

void onSignal(int /*signal*/)
{
    interruptRequested = true;
}

/// @brief Hand-off point between session callbacks and the main thread.
struct Completion
{
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<voxcap::Recording> recording;
    bool silenceStop = false;
    bool done = false;
};

auto writeRecording(const voxcap::Recording& recording, std::string const& path) -> voxcap::VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return voxcap::makeError(voxcap::ErrorCode::IoError,
                                     std::format("Failed to create '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(path, std::ios::binary);
    if (!file.is_open())
        return voxcap::makeError(voxcap::ErrorCode::IoError, std::format("Cannot write recording: {}", path));

    file.write(reinterpret_cast<const char*>(recording.bytes.data()),
               static_cast<std::streamsize>(recording.bytes.size()));
    if (!file)
        return voxcap::makeError(voxcap::ErrorCode::IoError, std::format("Failed writing recording: {}", path));
    return {};
}

auto presetList(std::span<const std::uint32_t> presets) -> std::string
{
    auto text = std::string {};
    for (auto const value: presets)
        text += std::format("{}{}", text.empty() ? "" : ", ", value);
    return text;
}

auto defaultOutputPath(const voxcap::AppConfig& config) -> std::string
{
    auto const dir = config.output.directory.empty() ? voxcap::defaultRecordingDir() : config.output.directory;
    auto const now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{}/recording-{:%Y%m%d-%H%M%S}.wav", dir, now);
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "voxcap: push-to-record voice capture with adaptive silence auto-stop" };

    auto configPath = std::string {};
    auto deviceName = std::string {};
    auto outputPath = std::string {};
    auto maxDuration = 0u;
    auto silenceMs = 0u;
    auto noSilence = false;
    auto listDevices = false;
    auto verbose = 0;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-d,--device", deviceName, "Capture device name filter (case-insensitive substring)");
    app.add_option("-o,--output", outputPath, "Output WAV file path");
    app.add_option("--max-duration",
                   maxDuration,
                   std::format("Maximum recording duration in seconds (common: {})",
                               presetList(voxcap::MaxDurationPresetsSeconds)));
    app.add_option("--silence-ms",
                   silenceMs,
                   std::format("Silence after speech that ends the recording in ms (common: {})",
                               presetList(voxcap::SilenceDurationPresetsMs)));
    app.add_flag("--no-silence", noSilence, "Disable silence auto-stop");
    app.add_flag("--list-devices", listDevices, "List capture devices and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging (repeat for per-tick trace)");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? voxcap::loadConfig() : voxcap::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voxcap::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    voxcap::log::setLevel(voxcap::log::raisedBy(config.logLevel, verbose));

    if (listDevices)
    {
        auto devices = voxcap::AudioCapture::listDevices();
        if (!devices)
        {
            voxcap::log::error("{}", devices.error().message);
            return 1;
        }
        for (auto i = std::size_t { 0 }; i < devices->size(); ++i)
            std::println("[{}] {}", i, (*devices)[i]);
        return 0;
    }

    // Apply CLI overrides
    if (!deviceName.empty())
        config.recording.deviceName = deviceName;
    if (maxDuration > 0)
        config.recording.maxDurationSeconds = maxDuration;
    if (silenceMs > 0)
        config.recording.silenceDurationMs = silenceMs;
    if (noSilence)
        config.recording.silenceDetectionEnabled = false;

    if (auto valid = voxcap::validateConfig(config); !valid)
    {
        voxcap::log::error("Invalid options: {}", valid.error().message);
        return 1;
    }

    auto completion = Completion {};
    auto events = voxcap::SessionEvents {
        .onSilenceStop =
            [&] {
                auto lock = std::lock_guard(completion.mutex);
                completion.silenceStop = true;
            },
        .onFinalized =
            [&](const voxcap::Recording& recording) {
                auto lock = std::lock_guard(completion.mutex);
                completion.recording = recording;
                completion.done = true;
                completion.cv.notify_all();
            },
    };

    auto controller = voxcap::RecordingController(std::make_unique<voxcap::AudioCapture>(), std::move(events));
    if (auto started = controller.start(voxcap::toRecordingOptions(config)); !started)
    {
        voxcap::log::error("Cannot start recording: {}", started.error());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::println(stderr, "Recording... press Enter to stop.");

    // Watches stdin and SIGINT for a manual stop. Without a usable stdin only SIGINT stops.
    auto manualStop = std::jthread([&](const std::stop_token& stopToken) {
        auto watchStdin = true;
        while (!stopToken.stop_requested())
        {
            if (!interruptRequested && watchStdin)
            {
                auto const key = voxcap::waitForStopKey(STDIN_FILENO, std::chrono::milliseconds(100));
                if (key == voxcap::StopKeyEvent::Closed)
                {
                    voxcap::log::debug("stdin closed, press Ctrl-C to stop");
                    watchStdin = false;
                }
                if (key != voxcap::StopKeyEvent::Pressed)
                    continue;
            }
            else if (!interruptRequested)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }

            if (auto stopped = controller.stop(); !stopped)
                voxcap::log::error("Stop failed: {}", stopped.error().message);
            return;
        }
    });

    auto recording = std::optional<voxcap::Recording> {};
    auto stoppedBySilence = false;
    while (!recording)
    {
        {
            auto lock = std::unique_lock(completion.mutex);
            if (completion.cv.wait_for(lock, std::chrono::milliseconds(200), [&] { return completion.done; }))
            {
                recording = std::move(completion.recording);
                stoppedBySilence = completion.silenceStop;
                break;
            }
        }

        // Idle without a finalized recording means the capture could not be finalized.
        if (controller.state() == voxcap::SessionState::Idle)
        {
            auto lock = std::lock_guard(completion.mutex);
            if (!completion.done)
            {
                voxcap::log::error("Recording ended without audio");
                manualStop.request_stop();
                return 1;
            }
        }
    }
    manualStop.request_stop();
    manualStop.join();

    // Joins any timer still winding down after a self-stop.
    if (auto finished = controller.stop(); !finished)
        voxcap::log::debug("No recording after stop: {}", finished.error().message);

    if (outputPath.empty())
        outputPath = defaultOutputPath(config);

    if (auto written = writeRecording(*recording, outputPath); !written)
    {
        voxcap::log::error("{}", written.error().message);
        return 1;
    }

    std::println("{} ({} bytes, {:.1f} s, stopped by {}{})",
                 outputPath,
                 recording->size(),
                 static_cast<double>(recording->duration.count()) / 1000.0,
                 voxcap::stopReasonName(recording->reason),
                 stoppedBySilence ? ", silence auto-stop" : "");
    return 0;
}
