#pragma once

#include <acoustics/core/settings.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace acoustics::audio {

using namespace acoustics::core;

// Audio thread callback: fill `sample_count` interleaved float samples in place
using RenderCallback = std::function<void(float* data, size_t sample_count, uint32_t channels)>;

// Playback device - drives a render callback from the platform audio thread
class AudioDevice {
public:
    AudioDevice();
    ~AudioDevice();

    // Non-copyable
    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    // Opens the default playback device. The callback must outlive the device.
    bool init(const AudioSettings& settings, RenderCallback callback);
    void shutdown();

    bool start();
    void stop();

    bool is_initialized() const;
    bool is_running() const;

    // Actual device format, valid after init()
    uint32_t sample_rate() const;
    uint32_t channels() const;

    // Blocks rendered since init()
    uint64_t blocks_rendered() const;

    // Defined in miniaudio_impl.cpp
    struct Impl;

private:
    std::unique_ptr<Impl> m_impl;
};

} // namespace acoustics::audio
