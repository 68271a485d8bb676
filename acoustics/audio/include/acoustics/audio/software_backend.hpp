#pragma once

#include <acoustics/audio/backend.hpp>
#include <acoustics/core/settings.hpp>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

// CPU reference backend.
//
// A scene is available once its exported file exists. The file is JSON; its optional
// "reverb" object sets room_size and damping of the environment. Every convolution
// effect runs a mono Freeverb-style tank and encodes the tail as first-order
// ambisonics towards the source. Bakes walk the probe grid of a region and keep the
// probe positions in memory, keyed by identifier.
//
// One mutex guards all objects, including the audio-thread calls.
class SoftwareBackend : public IAcousticsBackend {
public:
    explicit SoftwareBackend(const AudioSettings& audio_settings = {});
    ~SoftwareBackend() override;

    SceneHandle load_scene(const std::string& path) override;
    void release_scene(SceneHandle& scene) override;

    EnvironmentHandle create_environment(SceneHandle scene, const SimulationSettings& settings) override;
    void release_environment(EnvironmentHandle& environment) override;

    EnvironmentalRendererHandle create_environmental_renderer(EnvironmentHandle environment,
                                                              const RenderingSettings& settings,
                                                              const AudioFormat& output_format) override;
    void release_environmental_renderer(EnvironmentalRendererHandle& renderer) override;

    BinauralRendererHandle create_binaural_renderer(const RenderingSettings& settings) override;
    void release_binaural_renderer(BinauralRendererHandle& renderer) override;

    AudioResult create_ambisonics_binaural_effect(BinauralRendererHandle renderer,
                                                  const AudioFormat& input_format,
                                                  const AudioFormat& output_format,
                                                  EffectHandle& effect) override;
    AudioResult create_ambisonics_panning_effect(BinauralRendererHandle renderer,
                                                 const AudioFormat& input_format,
                                                 const AudioFormat& output_format,
                                                 EffectHandle& effect) override;
    AudioResult create_convolution_effect(EnvironmentalRendererHandle renderer,
                                          const std::string& identifier,
                                          SimulationType simulation_type,
                                          const AudioFormat& input_format,
                                          const AudioFormat& output_format,
                                          EffectHandle& effect) override;

    void set_baked_identifier(EffectHandle convolution, const BakedDataIdentifier& identifier) override;
    void flush_effect(EffectHandle effect) override;
    void destroy_effect(EffectHandle& effect) override;

    void set_dry_audio(EffectHandle convolution, const Vec3& source_position,
                       AudioBufferView dry) noexcept override;
    void get_wet_audio(EffectHandle convolution, const ListenerPose& listener,
                       AudioBufferView wet_ambisonics) noexcept override;
    void get_mixed_environmental_audio(EnvironmentalRendererHandle renderer,
                                       const ListenerPose& listener,
                                       AudioBufferView mixed_ambisonics) noexcept override;
    void apply_ambisonics_binaural(EffectHandle effect, AudioBufferView input,
                                   AudioBufferView output) noexcept override;
    void apply_ambisonics_panning(EffectHandle effect, AudioBufferView input,
                                  AudioBufferView output) noexcept override;

    AudioResult bake_reverb(EnvironmentHandle environment, const ProbeRegion& region,
                            BakingMode mode, const BakingSettings& settings,
                            const std::string& identifier, const BakeProgressFn& progress) override;
    void cancel_bake() override;

    // Inspection
    size_t effect_count() const;
    bool has_baked_data(const std::string& identifier) const;
    size_t baked_probe_count(const std::string& identifier) const;

    // Largest grid a single region may produce
    static constexpr uint64_t kMaxProbesPerRegion = 1u << 20;

    // Number of probes in a region's grid. Saturates instead of overflowing; NaN
    // extents count as oversized.
    static uint64_t probe_count(const ProbeRegion& region, const BakingSettings& settings);
    // Probe positions of a region's grid; empty when the grid exceeds kMaxProbesPerRegion
    static std::vector<Vec3> probe_grid(const ProbeRegion& region, const BakingSettings& settings);

private:
    static constexpr int kNumCombs = 8;
    static constexpr int kNumAllpass = 4;

    struct CombFilter {
        std::vector<float> buffer;
        size_t index = 0;
        float feedback = 0.0f;
        float filter_store = 0.0f;
        float damp1 = 0.0f;
        float damp2 = 0.0f;

        float process(float input);
    };

    struct AllpassFilter {
        std::vector<float> buffer;
        size_t index = 0;
        float feedback = 0.5f;

        float process(float input);
    };

    // Mono Freeverb tank
    struct ReverbTank {
        std::array<CombFilter, kNumCombs> combs;
        std::array<AllpassFilter, kNumAllpass> allpasses;

        void configure(uint32_t sample_rate, float room_size, float damping);
        float process(float input);
        void clear();
    };

    struct RoomParams {
        float room_size = 0.5f;
        float damping = 0.5f;
    };

    enum class EffectKind : uint8_t {
        AmbisonicsBinaural,
        AmbisonicsPanning,
        Convolution
    };

    struct Effect {
        EffectKind kind = EffectKind::AmbisonicsPanning;
        AudioFormat input_format;
        AudioFormat output_format;

        // Convolution only
        uint32_t renderer_id = UINT32_MAX;
        std::string identifier;
        SimulationType simulation_type = SimulationType::Realtime;
        BakedDataIdentifier baked_identifier;
        ReverbTank tank;
        Vec3 source_position{0.0f};
        std::vector<float> tail;    // Mono reverb of the last dry block
        size_t tail_frames = 0;
    };

    struct EnvironmentRecord {
        uint32_t scene_id = UINT32_MAX;
        RoomParams room;
    };

    struct RendererRecord {
        uint32_t environment_id = UINT32_MAX;
        AudioFormat output_format;
    };

    uint32_t next_id() { return m_next_id++; }
    Effect* find_effect(EffectHandle handle, EffectKind kind);
    bool tail_audible(const Effect& effect) const;
    void encode_tail(const Effect& effect, const ListenerPose& listener, float gain,
                     AudioBufferView out, bool accumulate) const;

    AudioSettings m_audio_settings;

    mutable std::mutex m_mutex;
    uint32_t m_next_id = 0;
    std::unordered_map<uint32_t, RoomParams> m_scenes;
    std::unordered_map<uint32_t, EnvironmentRecord> m_environments;
    std::unordered_map<uint32_t, RendererRecord> m_renderers;
    std::unordered_set<uint32_t> m_binaural_renderers;
    std::unordered_map<uint32_t, std::unique_ptr<Effect>> m_effects;
    // identifier -> region name -> probes; re-baking a region replaces its probes
    std::unordered_map<std::string, std::unordered_map<std::string, std::vector<Vec3>>> m_baked_probes;

    std::atomic<bool> m_cancel_bake{false};
};

} // namespace acoustics::audio
