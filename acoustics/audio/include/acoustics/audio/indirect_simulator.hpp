#pragma once

#include <acoustics/audio/acoustics_manager.hpp>
#include <acoustics/audio/backend.hpp>
#include <atomic>
#include <span>
#include <string>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

// Non-accelerated indirect sound for one emitter (a source, or the listener's own
// reverb stream): feeds dry audio into a convolution effect and decodes the
// ambisonics reverb into a wet block matching the input layout.
//
// lazy_initialize() and frame_update() run on the frame thread, audio_frame_update()
// on the audio thread. Effect handles are atomics so the audio thread sees either no
// effect or a fully created one. destroy() must not overlap audio_frame_update().
class IndirectSimulator {
public:
    IndirectSimulator() = default;
    ~IndirectSimulator();

    IndirectSimulator(const IndirectSimulator&) = delete;
    IndirectSimulator& operator=(const IndirectSimulator&) = delete;

    void initialize(IAcousticsBackend& backend, const AudioFormat& output_format,
                    const SimulationSettings& settings);

    // Creates the ambisonics decode effects and the convolution effect once their
    // prerequisites are valid. Safe to call every frame.
    void lazy_initialize(BinauralRendererHandle binaural_renderer,
                         bool reverb_enabled,
                         bool indirect_binaural,
                         const RenderingSettings& rendering_settings,
                         bool source_update,
                         SourceSimulationType source_simulation_type,
                         const std::string& identifier,
                         const StaticListener* static_listener,
                         ReverbSimulationType reverb_simulation_type,
                         EnvironmentalRendererHandle environmental_renderer);

    // Selects the baked data set for baked simulation; records whether dry audio is
    // routed to the environmental mixer this frame.
    void frame_update(bool source_update,
                      SourceSimulationType source_simulation_type,
                      ReverbSimulationType reverb_simulation_type,
                      const StaticListener* static_listener,
                      const IMixedAudioListener* listener);

    // Returns the wet block (same length as `data`), or an empty span when there is
    // nothing to add: reflections disabled, effect not created yet, or the dry audio
    // went to the accelerated mixer.
    std::span<const float> audio_frame_update(std::span<const float> data,
                                              uint32_t channels,
                                              const Vec3& source_position,
                                              const ListenerPose& listener_pose,
                                              bool enable_reflections,
                                              float indirect_mix_fraction,
                                              bool indirect_binaural,
                                              IMixedAudioListener* listener) noexcept;

    void flush();
    void destroy();

    bool initialized() const { return m_backend != nullptr; }
    bool has_convolution_effect() const { return m_convolution_effect.load().valid(); }
    const BakedDataIdentifier& baked_identifier() const { return m_baked_identifier; }

private:
    void report_creation_failure(const std::string& what, const AudioResult& result);

    IAcousticsBackend* m_backend = nullptr;
    AudioFormat m_output_format;
    AudioFormat m_ambisonics_format;
    bool m_error_logged = false;

    std::string m_identifier;
    SimulationType m_simulation_type = SimulationType::Realtime;
    BakedDataIdentifier m_baked_identifier;
    bool m_baked_identifier_sent = false;

    std::atomic<EffectHandle> m_binaural_effect{};
    std::atomic<EffectHandle> m_panning_effect{};
    std::atomic<EffectHandle> m_convolution_effect{};
    std::atomic<bool> m_accelerated_mixing{false};

    // Audio-thread scratch, sized once in initialize()
    std::vector<float> m_dry;
    std::vector<float> m_wet_ambisonics;
    std::vector<float> m_wet;
};

} // namespace acoustics::audio
