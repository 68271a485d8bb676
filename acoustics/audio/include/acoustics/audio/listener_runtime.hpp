#pragma once

#include <acoustics/audio/acoustics_manager.hpp>
#include <acoustics/audio/baker.hpp>
#include <acoustics/audio/indirect_mixer.hpp>
#include <acoustics/audio/indirect_simulator.hpp>
#include <acoustics/core/frame_scheduler.hpp>
#include <acoustics/core/transform.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

enum class LifecycleState : uint8_t {
    Uninitialized,  // No manager, or initialize() not called yet
    Initializing,   // Manager resolved, waiting for the environmental renderer
    Ready,
    Destroying,
    Destroyed
};

enum class MixingMode : uint8_t {
    Disabled,               // Pass-through
    RealtimeReverbBlend,    // input * dry + simulator wet
    AcceleratedMix          // Mixer writes the output
};

// Accelerated mixing takes precedence over reverb
MixingMode select_mixing_mode(bool reverb_enabled, bool accelerated_mixing);

const char* to_string(LifecycleState state);
const char* to_string(MixingMode mode);

// Host-side source of the listener's transform, sampled once per frame
using TransformSource = std::function<Transform()>;

// Per-listener indirect-sound runtime.
//
// Two threads drive it: the host frame thread (attach/detach, frame_update, setters,
// baking) and the audio thread (render). The only lock is shared by render() and
// destroy(): once destroy() has started, no render call touches the simulator or
// the mixer. frame_update() never takes it.
class ListenerRuntime : public IMixedAudioListener {
public:
    // `manager` may be null: the runtime then stays silent for its whole lifetime
    explicit ListenerRuntime(AcousticsManager* manager);
    ListenerRuntime(AcousticsManager* manager, const ListenerDefaults& defaults);
    ~ListenerRuntime() override;

    ListenerRuntime(const ListenerRuntime&) = delete;
    ListenerRuntime& operator=(const ListenerRuntime&) = delete;

    // Host lifecycle hooks

    // initialize() + lazy_initialize(), then registers frame_update() at the end of
    // every frame. Attaching a destroyed runtime starts its lifecycle over.
    void attach(FrameScheduler& scheduler, TransformSource transform_source);
    // Unregisters the frame task and destroys
    void detach(FrameScheduler& scheduler);
    // Disabling flushes the effects and pauses the frame task
    void set_enabled(FrameScheduler& scheduler, bool enabled);

    void initialize();
    void lazy_initialize();
    void destroy();

    // Frame thread, once per frame after every transform write
    void frame_update(const Transform& listener_transform);

    // Audio thread. Processes `sample_count` interleaved samples in place.
    void render(float* data, size_t sample_count, uint32_t channels) noexcept;

    // Drop effect tails and the mixed-audio signal
    void flush();

    // Baking, frame thread
    AudioResult begin_bake();
    AudioResult end_bake();
    void cancel_bake();
    const Baker& baker() const { return m_baker; }

    // IMixedAudioListener
    bool accelerated_mixing_enabled() const noexcept override;
    void notify_mixed_audio() noexcept override;
    void set_process_mixed_audio(bool process) noexcept;
    bool process_mixed_audio() const noexcept;

    // Configuration
    void set_reverb_enabled(bool enabled);
    bool reverb_enabled() const;
    void set_accelerated_mixing(bool enabled);
    bool accelerated_mixing() const;
    void set_indirect_binaural(bool enabled);
    bool indirect_binaural() const;
    void set_dry_mix_fraction(float fraction);      // Clamped to [0, 1]
    float dry_mix_fraction() const;
    void set_reverb_mix_fraction(float fraction);   // Clamped to [0, 10]
    float reverb_mix_fraction() const;
    void set_reverb_simulation_type(ReverbSimulationType type);
    ReverbSimulationType reverb_simulation_type() const;

    void set_use_all_probe_regions(bool use_all);
    bool use_all_probe_regions() const { return m_use_all_probe_regions; }
    void set_probe_regions(std::vector<ProbeRegion> regions);
    const std::vector<ProbeRegion>& probe_regions() const { return m_probe_regions; }

    // State
    LifecycleState state() const { return m_state.load(std::memory_order_acquire); }
    ListenerPose pose() const;
    const IndirectSimulator& simulator() const { return m_simulator; }
    const IndirectMixer& mixer() const { return m_mixer; }

    // Scheduler task name, unique per runtime
    const std::string& frame_task_name() const { return m_frame_task_name; }

    static constexpr const char* kFrameTaskPrefix = "acoustics.listener.frame_update#";

private:
    // Per-component relaxed atomics: a render block may see a pose mixed from two
    // consecutive frames, never a torn float.
    struct RelaxedVec3 {
        std::atomic<float> x{0.0f};
        std::atomic<float> y{0.0f};
        std::atomic<float> z{0.0f};

        void store(const Vec3& v);
        Vec3 load() const;
    };

    AcousticsManager* m_manager = nullptr;
    std::string m_frame_task_name;
    bool m_container_acquired = false;

    IndirectSimulator m_simulator;
    IndirectMixer m_mixer;
    Baker m_baker;

    std::mutex m_render_mutex;
    std::atomic<LifecycleState> m_state{LifecycleState::Uninitialized};
    std::atomic<EnvironmentalRendererHandle> m_environmental_renderer{};
    bool m_error_logged = false;

    RelaxedVec3 m_position;
    RelaxedVec3 m_ahead;
    RelaxedVec3 m_up;

    std::atomic<bool> m_enable_reverb{false};
    std::atomic<bool> m_accelerated_mixing{false};
    std::atomic<bool> m_indirect_binaural{false};
    std::atomic<bool> m_process_mixed_audio{false};
    std::atomic<float> m_dry_mix_fraction{1.0f};
    std::atomic<float> m_reverb_mix_fraction{1.0f};
    std::atomic<ReverbSimulationType> m_reverb_simulation_type{ReverbSimulationType::Realtime};

    bool m_use_all_probe_regions = false;
    std::vector<ProbeRegion> m_probe_regions;
};

} // namespace acoustics::audio
