// miniaudio implementation
// This file contains all miniaudio-specific code

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <acoustics/audio/audio_device.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <memory>
#include <string>

namespace acoustics::audio {

using namespace acoustics::core;

struct AudioDevice::Impl {
    ma_device device;
    bool initialized = false;
    std::atomic<bool> running{false};
    std::atomic<uint64_t> blocks{0};
    RenderCallback callback;
};

static void data_callback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frame_count) {
    auto* impl = static_cast<AudioDevice::Impl*>(device->pUserData);
    auto* samples = static_cast<float*>(output);
    const uint32_t channels = device->playback.channels;
    const size_t sample_count = static_cast<size_t>(frame_count) * channels;

    // miniaudio hands over a zeroed buffer unless noPreSilencedOutputBuffer is set
    if (impl && impl->callback) {
        impl->callback(samples, sample_count, channels);
    } else {
        std::fill_n(samples, sample_count, 0.0f);
    }
    if (impl) ++impl->blocks;
}

AudioDevice::AudioDevice() : m_impl(std::make_unique<Impl>()) {}

AudioDevice::~AudioDevice() {
    shutdown();
}

bool AudioDevice::init(const AudioSettings& settings, RenderCallback callback) {
    if (m_impl->initialized) return true;

    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = settings.channels;
    config.sampleRate = settings.sample_rate;
    config.periodSizeInFrames = settings.frame_size;
    config.dataCallback = data_callback;
    config.pUserData = m_impl.get();

    m_impl->callback = std::move(callback);

    if (ma_device_init(nullptr, &config, &m_impl->device) != MA_SUCCESS) {
        log(LogLevel::Error, "[AudioDevice] Failed to initialize playback device");
        m_impl->callback = nullptr;
        return false;
    }

    m_impl->initialized = true;
    m_impl->blocks = 0;
    log(LogLevel::Info, "[AudioDevice] Opened " + std::string(m_impl->device.playback.name) + " (" +
        std::to_string(m_impl->device.sampleRate) + " Hz, " +
        std::to_string(m_impl->device.playback.channels) + " channels)");
    return true;
}

void AudioDevice::shutdown() {
    if (!m_impl || !m_impl->initialized) return;

    // Uninit stops the device and waits for the audio thread
    ma_device_uninit(&m_impl->device);
    m_impl->running = false;
    m_impl->initialized = false;
    m_impl->callback = nullptr;
}

bool AudioDevice::start() {
    if (!m_impl->initialized) return false;
    if (m_impl->running) return true;

    if (ma_device_start(&m_impl->device) != MA_SUCCESS) {
        log(LogLevel::Error, "[AudioDevice] Failed to start playback device");
        return false;
    }
    m_impl->running = true;
    return true;
}

void AudioDevice::stop() {
    if (!m_impl->initialized || !m_impl->running) return;

    if (ma_device_stop(&m_impl->device) != MA_SUCCESS) {
        log(LogLevel::Warn, "[AudioDevice] Failed to stop playback device");
    }
    m_impl->running = false;
}

bool AudioDevice::is_initialized() const {
    return m_impl->initialized;
}

bool AudioDevice::is_running() const {
    return m_impl->running;
}

uint32_t AudioDevice::sample_rate() const {
    return m_impl->initialized ? m_impl->device.sampleRate : 0;
}

uint32_t AudioDevice::channels() const {
    return m_impl->initialized ? m_impl->device.playback.channels : 0;
}

uint64_t AudioDevice::blocks_rendered() const {
    return m_impl->blocks;
}

} // namespace acoustics::audio
