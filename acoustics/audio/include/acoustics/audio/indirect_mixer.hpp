#pragma once

#include <acoustics/audio/backend.hpp>
#include <atomic>
#include <span>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

// Accelerated indirect path: fetches the environmental renderer's mix of every
// source's reverb and decodes it straight into the output block. The caller applies
// nothing on top.
class IndirectMixer {
public:
    IndirectMixer() = default;
    ~IndirectMixer();

    IndirectMixer(const IndirectMixer&) = delete;
    IndirectMixer& operator=(const IndirectMixer&) = delete;

    void initialize(IAcousticsBackend& backend, const AudioFormat& output_format,
                    const SimulationSettings& settings);

    void lazy_initialize(BinauralRendererHandle binaural_renderer,
                         bool accelerated_mixing,
                         bool indirect_binaural,
                         const RenderingSettings& rendering_settings);

    // Overwrites `data`. Writes silence when the decoders are not created yet.
    void audio_frame_update(std::span<float> data,
                            uint32_t channels,
                            EnvironmentalRendererHandle environmental_renderer,
                            const ListenerPose& listener_pose,
                            bool indirect_binaural) noexcept;

    void flush();
    void destroy();

    bool initialized() const { return m_backend != nullptr; }
    bool has_effects() const { return m_panning_effect.load().valid(); }

private:
    IAcousticsBackend* m_backend = nullptr;
    AudioFormat m_output_format;
    AudioFormat m_ambisonics_format;
    bool m_error_logged = false;

    std::atomic<EffectHandle> m_binaural_effect{};
    std::atomic<EffectHandle> m_panning_effect{};

    std::vector<float> m_mixed_ambisonics;
};

} // namespace acoustics::audio
