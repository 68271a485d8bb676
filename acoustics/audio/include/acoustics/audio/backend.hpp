#pragma once

#include <acoustics/audio/types.hpp>
#include <functional>
#include <string>

namespace acoustics::audio {

using namespace acoustics::core;

// Progress callback for baking, fraction in [0, 1] for the current region
using BakeProgressFn = std::function<void(float)>;

// Spatial audio engine boundary: scene and renderer objects, HRTF and convolution
// effects, environmental mixing and reverb baking.
//
// Threading contract:
// - Creation, release, identifier updates and baking are called from the frame/host thread.
// - The noexcept audio functions are called from the audio thread, concurrently with the
//   frame thread. Implementations synchronize their own internal state.
// - destroy_effect() is never called while an audio call on the same effect is running.
class IAcousticsBackend {
public:
    virtual ~IAcousticsBackend() = default;

    // Scene and renderers

    // Invalid handle when the scene was not exported
    virtual SceneHandle load_scene(const std::string& path) = 0;
    virtual void release_scene(SceneHandle& scene) = 0;

    virtual EnvironmentHandle create_environment(SceneHandle scene, const SimulationSettings& settings) = 0;
    virtual void release_environment(EnvironmentHandle& environment) = 0;

    virtual EnvironmentalRendererHandle create_environmental_renderer(EnvironmentHandle environment,
                                                                      const RenderingSettings& settings,
                                                                      const AudioFormat& output_format) = 0;
    virtual void release_environmental_renderer(EnvironmentalRendererHandle& renderer) = 0;

    virtual BinauralRendererHandle create_binaural_renderer(const RenderingSettings& settings) = 0;
    virtual void release_binaural_renderer(BinauralRendererHandle& renderer) = 0;

    // Effects

    virtual AudioResult create_ambisonics_binaural_effect(BinauralRendererHandle renderer,
                                                          const AudioFormat& input_format,
                                                          const AudioFormat& output_format,
                                                          EffectHandle& effect) = 0;

    virtual AudioResult create_ambisonics_panning_effect(BinauralRendererHandle renderer,
                                                         const AudioFormat& input_format,
                                                         const AudioFormat& output_format,
                                                         EffectHandle& effect) = 0;

    virtual AudioResult create_convolution_effect(EnvironmentalRendererHandle renderer,
                                                  const std::string& identifier,
                                                  SimulationType simulation_type,
                                                  const AudioFormat& input_format,
                                                  const AudioFormat& output_format,
                                                  EffectHandle& effect) = 0;

    // Select the baked data set a convolution effect reads from
    virtual void set_baked_identifier(EffectHandle convolution, const BakedDataIdentifier& identifier) = 0;

    // Clear internal delay lines and tails
    virtual void flush_effect(EffectHandle effect) = 0;
    virtual void destroy_effect(EffectHandle& effect) = 0;

    // Audio thread

    virtual void set_dry_audio(EffectHandle convolution, const Vec3& source_position,
                               AudioBufferView dry) noexcept = 0;

    // Ambisonics-encoded reverb for one source, at the listener pose
    virtual void get_wet_audio(EffectHandle convolution, const ListenerPose& listener,
                               AudioBufferView wet_ambisonics) noexcept = 0;

    // Ambisonics-encoded reverb of every convolution effect of the renderer, mixed
    virtual void get_mixed_environmental_audio(EnvironmentalRendererHandle renderer,
                                               const ListenerPose& listener,
                                               AudioBufferView mixed_ambisonics) noexcept = 0;

    virtual void apply_ambisonics_binaural(EffectHandle effect, AudioBufferView input,
                                           AudioBufferView output) noexcept = 0;

    virtual void apply_ambisonics_panning(EffectHandle effect, AudioBufferView input,
                                          AudioBufferView output) noexcept = 0;

    // Baking

    // Blocking; called from a worker thread
    virtual AudioResult bake_reverb(EnvironmentHandle environment, const ProbeRegion& region,
                                    BakingMode mode, const BakingSettings& settings,
                                    const std::string& identifier, const BakeProgressFn& progress) = 0;

    // Thread-safe; makes a running bake_reverb() return BakeCancelled
    virtual void cancel_bake() = 0;
};

} // namespace acoustics::audio
