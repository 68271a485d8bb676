#include <acoustics/audio/indirect_mixer.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>
#include <cstddef>

namespace acoustics::audio {

using namespace acoustics::core;

static constexpr uint32_t kMaxOutputChannels = 8;
static constexpr size_t kMaxFrames = 4096;

IndirectMixer::~IndirectMixer() {
    destroy();
}

void IndirectMixer::initialize(IAcousticsBackend& backend, const AudioFormat& output_format,
                               const SimulationSettings& settings) {
    m_backend = &backend;
    m_output_format = output_format;
    m_ambisonics_format = AudioFormat::ambisonics(settings.ambisonics_order);
    m_mixed_ambisonics.assign(kMaxFrames * m_ambisonics_format.channels, 0.0f);
    m_error_logged = false;
}

void IndirectMixer::lazy_initialize(BinauralRendererHandle binaural_renderer,
                                    bool accelerated_mixing,
                                    bool /*indirect_binaural*/,
                                    const RenderingSettings& /*rendering_settings*/) {
    if (!m_backend || !accelerated_mixing || !binaural_renderer.valid()) return;
    if (m_panning_effect.load().valid()) return;

    if (!m_binaural_effect.load().valid()) {
        EffectHandle effect;
        auto result = m_backend->create_ambisonics_binaural_effect(
            binaural_renderer, m_ambisonics_format, AudioFormat::speakers(2), effect);
        if (!result) {
            if (!m_error_logged) {
                log(LogLevel::Error, "[IndirectMixer] Unable to create ambisonics binaural effect: " + result.message);
                m_error_logged = true;
            }
            return;
        }
        m_binaural_effect.store(effect);
    }

    EffectHandle effect;
    auto result = m_backend->create_ambisonics_panning_effect(
        binaural_renderer, m_ambisonics_format, m_output_format, effect);
    if (!result) {
        if (!m_error_logged) {
            log(LogLevel::Error, "[IndirectMixer] Unable to create ambisonics panning effect: " + result.message);
            m_error_logged = true;
        }
        return;
    }
    m_panning_effect.store(effect, std::memory_order_release);
}

void IndirectMixer::audio_frame_update(std::span<float> data,
                                       uint32_t channels,
                                       EnvironmentalRendererHandle environmental_renderer,
                                       const ListenerPose& listener_pose,
                                       bool indirect_binaural) noexcept {
    if (data.empty()) return;

    EffectHandle panning = m_panning_effect.load(std::memory_order_acquire);
    const size_t frames = channels > 0 ? data.size() / channels : 0;
    if (!panning.valid() || !environmental_renderer.valid() ||
        channels == 0 || channels > kMaxOutputChannels || frames == 0 || frames > kMaxFrames) {
        std::fill(data.begin(), data.end(), 0.0f);
        return;
    }

    AudioBufferView mixed{m_mixed_ambisonics.data(), frames, m_ambisonics_format.channels};
    m_backend->get_mixed_environmental_audio(environmental_renderer, listener_pose, mixed);

    AudioBufferView output{data.data(), frames, channels};
    EffectHandle binaural = m_binaural_effect.load();
    if (indirect_binaural && channels == 2 && binaural.valid()) {
        m_backend->apply_ambisonics_binaural(binaural, mixed, output);
    } else {
        m_backend->apply_ambisonics_panning(panning, mixed, output);
    }

    // Trailing samples of a block that is not a whole number of frames
    std::fill(data.begin() + static_cast<std::ptrdiff_t>(frames * channels), data.end(), 0.0f);
}

void IndirectMixer::flush() {
    if (!m_backend) return;

    if (auto effect = m_binaural_effect.load(); effect.valid()) m_backend->flush_effect(effect);
    if (auto effect = m_panning_effect.load(); effect.valid()) m_backend->flush_effect(effect);
}

void IndirectMixer::destroy() {
    if (!m_backend) return;

    EffectHandle panning = m_panning_effect.exchange(EffectHandle{});
    EffectHandle binaural = m_binaural_effect.exchange(EffectHandle{});

    if (panning.valid()) m_backend->destroy_effect(panning);
    if (binaural.valid()) m_backend->destroy_effect(binaural);

    m_backend = nullptr;
}

} // namespace acoustics::audio
