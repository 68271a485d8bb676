// Listener Demo
// Orbits a listener around the origin for a few seconds and renders a click train
// through its indirect-sound runtime.

#include <acoustics/audio/acoustics_manager.hpp>
#include <acoustics/audio/audio_device.hpp>
#include <acoustics/audio/listener_runtime.hpp>
#include <acoustics/audio/software_backend.hpp>
#include <acoustics/core/filesystem.hpp>
#include <acoustics/core/frame_scheduler.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

using namespace acoustics::core;
using namespace acoustics::audio;

namespace {

constexpr double kDemoSeconds = 5.0;
constexpr double kFrameSeconds = 1.0 / 60.0;
constexpr float kOrbitRadius = 3.0f;

// Dry source signal: one short click every half second
class ClickTrain {
public:
    explicit ClickTrain(uint32_t sample_rate) : m_period(sample_rate / 2) {}

    void fill(float* data, size_t sample_count, uint32_t channels) {
        for (size_t i = 0; i + channels <= sample_count; i += channels) {
            float s = (m_phase < 64) ? 0.5f : 0.0f;
            for (uint32_t c = 0; c < channels; ++c) data[i + c] = s;
            if (++m_phase >= m_period) m_phase = 0;
        }
    }

private:
    uint32_t m_period;
    uint32_t m_phase = 0;
};

} // namespace

int main(int argc, char** argv) {
    log(LogLevel::Info, "Listener Demo starting...");

    AcousticsSettings settings;
    std::string settings_path = argc > 1 ? argv[1] : "acoustics.json";
    if (FileSystem::exists(settings_path) && !settings.load(settings_path)) {
        log(LogLevel::Warn, "Using default acoustics settings");
    }
    settings.listener.enable_reverb = true;
    settings.listener.reverb_mix_fraction = 1.5f;
    settings.listener.reverb_simulation_type = ReverbSimulationType::Baked;

    // Export a small hall if the host has not exported a scene yet
    if (!FileSystem::exists(settings.scene_file)) {
        if (!FileSystem::write_text(settings.scene_file, R"({"reverb": {"room_size": 0.85, "damping": 0.25}})")) {
            log(LogLevel::Error, "Failed to export demo scene to " + settings.scene_file);
            return 1;
        }
    }

    SoftwareBackend backend(settings.audio);
    AcousticsManager manager(backend, settings);
    manager.add_probe_region(ProbeRegion::from_box("hall", Vec3{0.0f, 2.0f, 0.0f}, Vec3{12.0f, 4.0f, 12.0f}));

    FrameScheduler scheduler;
    ListenerRuntime listener(&manager);
    listener.set_use_all_probe_regions(true);

    Transform listener_transform;
    listener.attach(scheduler, [&listener_transform]() { return listener_transform; });

    // Bake the listener reverb before playback
    if (auto result = listener.begin_bake(); !result) {
        log(LogLevel::Error, "Failed to start bake: " + result.message);
    } else {
        auto baked = listener.end_bake();
        log(LogLevel::Info, std::string("Bake finished: ") + to_string(listener.baker().status()) +
            (baked ? "" : " (" + baked.message + ")"));
    }

    ClickTrain clicks(settings.audio.sample_rate);
    AudioDevice device;
    bool realtime = device.init(settings.audio, [&clicks, &listener](float* data, size_t sample_count, uint32_t channels) {
        clicks.fill(data, sample_count, channels);
        listener.render(data, sample_count, channels);
    });
    if (realtime) {
        realtime = device.start();
    }
    if (!realtime) {
        log(LogLevel::Warn, "No playback device, rendering offline");
    }

    std::vector<float> offline_block(static_cast<size_t>(settings.audio.frame_size) * settings.audio.channels);
    double elapsed = 0.0;
    double offline_audio = 0.0;
    float peak = 0.0f;

    while (elapsed < kDemoSeconds) {
        float angle = static_cast<float>(elapsed) * 0.8f;
        listener_transform.position = Vec3{std::cos(angle) * kOrbitRadius, 1.7f, std::sin(angle) * kOrbitRadius};
        listener_transform.look_at(Vec3{0.0f, 1.7f, 0.0f});

        scheduler.tick(kFrameSeconds);
        elapsed += kFrameSeconds;

        if (realtime) {
            std::this_thread::sleep_for(std::chrono::duration<double>(kFrameSeconds));
            continue;
        }

        // Keep the offline audio clock in step with the frame clock
        const double block_seconds = static_cast<double>(settings.audio.frame_size) / settings.audio.sample_rate;
        while (offline_audio < elapsed) {
            clicks.fill(offline_block.data(), offline_block.size(), settings.audio.channels);
            listener.render(offline_block.data(), offline_block.size(), settings.audio.channels);
            for (float s : offline_block) peak = std::max(peak, std::abs(s));
            offline_audio += block_seconds;
        }
    }

    if (realtime) {
        device.stop();
        log(LogLevel::Info, "Rendered " + std::to_string(device.blocks_rendered()) + " blocks");
    } else {
        log(LogLevel::Info, "Offline peak level " + std::to_string(peak));
    }

    device.shutdown();
    listener.detach(scheduler);

    log(LogLevel::Info, "Listener Demo finished");
    return 0;
}
