#include <acoustics/audio/indirect_simulator.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>

namespace acoustics::audio {

using namespace acoustics::core;

// Largest interleaved speaker layout (7.1)
static constexpr uint32_t kMaxOutputChannels = 8;
// Largest audio block, in frames, processed without allocating on the audio thread
static constexpr size_t kMaxFrames = 4096;

IndirectSimulator::~IndirectSimulator() {
    destroy();
}

void IndirectSimulator::initialize(IAcousticsBackend& backend, const AudioFormat& output_format,
                                   const SimulationSettings& settings) {
    m_backend = &backend;
    m_output_format = output_format;
    m_ambisonics_format = AudioFormat::ambisonics(settings.ambisonics_order);

    m_dry.assign(kMaxFrames * kMaxOutputChannels, 0.0f);
    m_wet.assign(kMaxFrames * kMaxOutputChannels, 0.0f);
    m_wet_ambisonics.assign(kMaxFrames * m_ambisonics_format.channels, 0.0f);
    m_error_logged = false;
    m_baked_identifier = {};
    m_baked_identifier_sent = false;
}

void IndirectSimulator::lazy_initialize(BinauralRendererHandle binaural_renderer,
                                        bool reverb_enabled,
                                        bool /*indirect_binaural*/,
                                        const RenderingSettings& /*rendering_settings*/,
                                        bool source_update,
                                        SourceSimulationType source_simulation_type,
                                        const std::string& identifier,
                                        const StaticListener* /*static_listener*/,
                                        ReverbSimulationType reverb_simulation_type,
                                        EnvironmentalRendererHandle environmental_renderer) {
    if (!m_backend || !reverb_enabled) return;
    if (m_convolution_effect.load().valid()) return;

    // Both decoders are created so binaural output can be toggled at runtime
    if (binaural_renderer.valid() && !m_binaural_effect.load().valid()) {
        EffectHandle effect;
        auto result = m_backend->create_ambisonics_binaural_effect(
            binaural_renderer, m_ambisonics_format, AudioFormat::speakers(2), effect);
        if (!result) {
            report_creation_failure("ambisonics binaural effect", result);
            return;
        }
        m_binaural_effect.store(effect);
    }

    if (binaural_renderer.valid() && !m_panning_effect.load().valid()) {
        EffectHandle effect;
        auto result = m_backend->create_ambisonics_panning_effect(
            binaural_renderer, m_ambisonics_format, m_output_format, effect);
        if (!result) {
            report_creation_failure("ambisonics panning effect", result);
            return;
        }
        m_panning_effect.store(effect);
    }

    if (!environmental_renderer.valid() || !m_panning_effect.load().valid()) return;

    bool baked = source_update ? source_simulation_type == SourceSimulationType::Baked
                               : reverb_simulation_type == ReverbSimulationType::Baked;
    m_simulation_type = baked ? SimulationType::Baked : SimulationType::Realtime;
    m_identifier = identifier;

    EffectHandle effect;
    auto result = m_backend->create_convolution_effect(
        environmental_renderer, m_identifier, m_simulation_type, m_output_format, m_ambisonics_format, effect);
    if (!result) {
        report_creation_failure("convolution effect for " + m_identifier, result);
        return;
    }

    // Published last: a valid convolution effect implies valid decoders
    m_convolution_effect.store(effect, std::memory_order_release);
    m_baked_identifier_sent = false;
}

void IndirectSimulator::frame_update(bool source_update,
                                     SourceSimulationType source_simulation_type,
                                     ReverbSimulationType reverb_simulation_type,
                                     const StaticListener* static_listener,
                                     const IMixedAudioListener* listener) {
    if (!m_backend) return;

    m_accelerated_mixing.store(listener && listener->accelerated_mixing_enabled(), std::memory_order_relaxed);

    EffectHandle convolution = m_convolution_effect.load();
    if (!convolution.valid()) return;

    BakedDataIdentifier identifier;
    if (source_update && source_simulation_type == SourceSimulationType::Baked) {
        identifier = {BakedDataType::StaticSource, m_identifier};
    } else if (!source_update && reverb_simulation_type == ReverbSimulationType::Baked) {
        if (static_listener && static_listener->has_node()) {
            identifier = {BakedDataType::StaticListener, static_listener->current_node};
        } else {
            identifier = {BakedDataType::Reverb, m_identifier};
        }
    } else {
        return;
    }

    if (m_baked_identifier_sent && identifier == m_baked_identifier) return;

    m_backend->set_baked_identifier(convolution, identifier);
    m_baked_identifier = identifier;
    m_baked_identifier_sent = true;
}

std::span<const float> IndirectSimulator::audio_frame_update(std::span<const float> data,
                                                             uint32_t channels,
                                                             const Vec3& source_position,
                                                             const ListenerPose& listener_pose,
                                                             bool enable_reflections,
                                                             float indirect_mix_fraction,
                                                             bool indirect_binaural,
                                                             IMixedAudioListener* listener) noexcept {
    if (!enable_reflections || data.empty() || channels == 0 || channels > kMaxOutputChannels) return {};

    EffectHandle convolution = m_convolution_effect.load(std::memory_order_acquire);
    if (!convolution.valid()) return {};

    const size_t frames = data.size() / channels;
    const size_t samples = frames * channels;
    if (frames == 0 || frames > kMaxFrames) return {};

    std::copy_n(data.begin(), samples, m_dry.begin());
    m_backend->set_dry_audio(convolution, source_position, {m_dry.data(), frames, channels});

    if (m_accelerated_mixing.load(std::memory_order_relaxed)) {
        // The environmental mixer picks this source up; nothing to add locally
        if (listener) listener->notify_mixed_audio();
        return {};
    }

    const uint32_t ambisonics_channels = m_ambisonics_format.channels;
    AudioBufferView ambisonics{m_wet_ambisonics.data(), frames, ambisonics_channels};
    m_backend->get_wet_audio(convolution, listener_pose, ambisonics);

    AudioBufferView wet{m_wet.data(), frames, channels};
    EffectHandle binaural = m_binaural_effect.load();
    if (indirect_binaural && channels == 2 && binaural.valid()) {
        m_backend->apply_ambisonics_binaural(binaural, ambisonics, wet);
    } else {
        EffectHandle panning = m_panning_effect.load();
        if (!panning.valid()) return {};
        m_backend->apply_ambisonics_panning(panning, ambisonics, wet);
    }

    for (size_t i = 0; i < samples; ++i) {
        m_wet[i] *= indirect_mix_fraction;
    }

    return {m_wet.data(), samples};
}

void IndirectSimulator::flush() {
    if (!m_backend) return;

    if (auto effect = m_convolution_effect.load(); effect.valid()) m_backend->flush_effect(effect);
    if (auto effect = m_binaural_effect.load(); effect.valid()) m_backend->flush_effect(effect);
    if (auto effect = m_panning_effect.load(); effect.valid()) m_backend->flush_effect(effect);
}

void IndirectSimulator::destroy() {
    if (!m_backend) return;

    EffectHandle convolution = m_convolution_effect.exchange(EffectHandle{});
    EffectHandle binaural = m_binaural_effect.exchange(EffectHandle{});
    EffectHandle panning = m_panning_effect.exchange(EffectHandle{});

    if (convolution.valid()) m_backend->destroy_effect(convolution);
    if (binaural.valid()) m_backend->destroy_effect(binaural);
    if (panning.valid()) m_backend->destroy_effect(panning);

    m_backend = nullptr;
    m_baked_identifier_sent = false;
}

// Effect creation is retried every frame; only the first failure is logged
void IndirectSimulator::report_creation_failure(const std::string& what, const AudioResult& result) {
    if (m_error_logged) return;
    log(LogLevel::Error, "[IndirectSimulator] Unable to create " + what + ": " + result.message);
    m_error_logged = true;
}

} // namespace acoustics::audio
