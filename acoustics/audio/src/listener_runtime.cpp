#include <acoustics/audio/listener_runtime.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>
#include <span>
#include <string>

namespace acoustics::audio {

using namespace acoustics::core;

MixingMode select_mixing_mode(bool reverb_enabled, bool accelerated_mixing) {
    if (accelerated_mixing) return MixingMode::AcceleratedMix;
    if (reverb_enabled) return MixingMode::RealtimeReverbBlend;
    return MixingMode::Disabled;
}

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Initializing:  return "initializing";
        case LifecycleState::Ready:         return "ready";
        case LifecycleState::Destroying:    return "destroying";
        case LifecycleState::Destroyed:     return "destroyed";
    }
    return "uninitialized";
}

const char* to_string(MixingMode mode) {
    switch (mode) {
        case MixingMode::Disabled:            return "disabled";
        case MixingMode::RealtimeReverbBlend: return "realtime reverb blend";
        case MixingMode::AcceleratedMix:      return "accelerated mix";
    }
    return "disabled";
}

void ListenerRuntime::RelaxedVec3::store(const Vec3& v) {
    x.store(v.x, std::memory_order_relaxed);
    y.store(v.y, std::memory_order_relaxed);
    z.store(v.z, std::memory_order_relaxed);
}

Vec3 ListenerRuntime::RelaxedVec3::load() const {
    return Vec3{
        x.load(std::memory_order_relaxed),
        y.load(std::memory_order_relaxed),
        z.load(std::memory_order_relaxed)
    };
}

ListenerRuntime::ListenerRuntime(AcousticsManager* manager)
    : ListenerRuntime(manager, manager ? manager->settings().listener : ListenerDefaults{}) {}

namespace {

std::atomic<uint32_t> s_next_runtime_id{0};

} // namespace

ListenerRuntime::ListenerRuntime(AcousticsManager* manager, const ListenerDefaults& defaults)
    : m_manager(manager)
    , m_frame_task_name(kFrameTaskPrefix + std::to_string(s_next_runtime_id.fetch_add(1))) {
    set_reverb_enabled(defaults.enable_reverb);
    set_accelerated_mixing(defaults.accelerated_mixing);
    set_indirect_binaural(defaults.indirect_binaural);
    set_dry_mix_fraction(defaults.dry_mix_fraction);
    set_reverb_mix_fraction(defaults.reverb_mix_fraction);
    set_reverb_simulation_type(defaults.reverb_simulation_type);
    m_use_all_probe_regions = defaults.use_all_probe_regions;

    m_ahead.store(Vec3{0.0f, 0.0f, -1.0f});
    m_up.store(Vec3{0.0f, 1.0f, 0.0f});
}

ListenerRuntime::~ListenerRuntime() {
    destroy();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void ListenerRuntime::attach(FrameScheduler& scheduler, TransformSource transform_source) {
    {
        std::lock_guard<std::mutex> lock(m_render_mutex);
        LifecycleState expected = LifecycleState::Destroyed;
        if (m_state.compare_exchange_strong(expected, LifecycleState::Uninitialized)) {
            log(LogLevel::Info, "[ListenerRuntime] Re-attaching destroyed listener");
        }
    }

    initialize();
    lazy_initialize();

    if (scheduler.contains(m_frame_task_name)) return;

    scheduler.add(Phase::EndOfFrame, [this, source = std::move(transform_source)](double /*dt*/) {
        frame_update(source ? source() : Transform{});
    }, m_frame_task_name);
}

void ListenerRuntime::detach(FrameScheduler& scheduler) {
    scheduler.remove(m_frame_task_name);
    destroy();
}

void ListenerRuntime::set_enabled(FrameScheduler& scheduler, bool enabled) {
    if (!enabled) {
        flush();
    }
    scheduler.set_enabled(m_frame_task_name, enabled);
}

void ListenerRuntime::initialize() {
    LifecycleState current = m_state.load();
    if (current != LifecycleState::Uninitialized) return;

    m_error_logged = false;

    if (!m_manager) {
        log(LogLevel::Error, "[ListenerRuntime] Acoustics manager not found; indirect sound is disabled for this listener");
        return;
    }

    m_manager->initialize(true);
    m_manager->container().initialize(true, m_manager->settings());
    m_container_acquired = true;

    m_simulator.initialize(m_manager->backend(), m_manager->audio_format(), m_manager->simulation_settings());
    m_mixer.initialize(m_manager->backend(), m_manager->audio_format(), m_manager->simulation_settings());

    m_manager->set_listener(this);
    m_state.store(LifecycleState::Initializing, std::memory_order_release);
}

void ListenerRuntime::lazy_initialize() {
    if (!m_manager || !m_container_acquired) return;

    LifecycleState current = m_state.load();
    if (current == LifecycleState::Destroying || current == LifecycleState::Destroyed) return;

    auto& container = m_manager->container();
    container.resolve();

    const bool accelerated = m_accelerated_mixing.load();
    const bool binaural = m_indirect_binaural.load();

    m_simulator.lazy_initialize(container.binaural_renderer(), m_enable_reverb.load() && !accelerated,
        binaural, m_manager->rendering_settings(), false, SourceSimulationType::Realtime,
        kReverbIdentifier, m_manager->static_listener(), m_reverb_simulation_type.load(),
        container.environmental_renderer());

    m_mixer.lazy_initialize(container.binaural_renderer(), accelerated, binaural,
        m_manager->rendering_settings());
}

void ListenerRuntime::destroy() {
    // Bakes read the environment released below
    if (m_baker.is_baking()) {
        m_baker.cancel_bake();
        (void)m_baker.end_bake();
    }

    std::lock_guard<std::mutex> lock(m_render_mutex);

    LifecycleState current = m_state.load();
    if (current == LifecycleState::Destroying || current == LifecycleState::Destroyed) return;
    m_state.store(LifecycleState::Destroying, std::memory_order_release);

    m_mixer.destroy();
    m_simulator.destroy();
    m_environmental_renderer.store(EnvironmentalRendererHandle{});
    m_process_mixed_audio.store(false, std::memory_order_release);

    if (m_manager) {
        m_manager->clear_listener(this);
        if (m_container_acquired) {
            m_manager->container().destroy();
            m_container_acquired = false;
        }
    }

    m_state.store(LifecycleState::Destroyed, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// Frame thread
// ---------------------------------------------------------------------------

void ListenerRuntime::frame_update(const Transform& listener_transform) {
    LifecycleState current = m_state.load();
    if (current == LifecycleState::Destroying || current == LifecycleState::Destroyed) return;

    lazy_initialize();

    if (!m_manager || !m_container_acquired) return;
    auto& container = m_manager->container();

    if (!m_error_logged && m_enable_reverb.load() && !container.scene().valid()) {
        log(LogLevel::Error, "[ListenerRuntime] Scene not found. Make sure to pre-export the scene.");
        m_error_logged = true;
    }

    EnvironmentalRendererHandle renderer = container.environmental_renderer();
    if (renderer.valid() && m_state.load() == LifecycleState::Initializing) {
        // Handle first, then state: a Ready render always sees the renderer
        m_environmental_renderer.store(renderer, std::memory_order_release);
        LifecycleState expected = LifecycleState::Initializing;
        if (m_state.compare_exchange_strong(expected, LifecycleState::Ready)) {
            log(LogLevel::Info, "[ListenerRuntime] Environmental renderer ready");
        }
    }

    m_position.store(listener_transform.position);
    m_ahead.store(listener_transform.forward());
    m_up.store(listener_transform.up());

    m_simulator.frame_update(false, SourceSimulationType::Realtime, m_reverb_simulation_type.load(),
        m_manager->static_listener(), this);
}

// ---------------------------------------------------------------------------
// Audio thread
// ---------------------------------------------------------------------------

void ListenerRuntime::render(float* data, size_t sample_count, uint32_t channels) noexcept {
    std::lock_guard<std::mutex> lock(m_render_mutex);

    if (!data) return;

    const bool accelerated = m_accelerated_mixing.load(std::memory_order_relaxed);
    const bool reverb = m_enable_reverb.load(std::memory_order_relaxed);

    if (m_state.load(std::memory_order_acquire) != LifecycleState::Ready || channels == 0 ||
        (accelerated && !m_process_mixed_audio.load(std::memory_order_acquire))) {
        std::fill_n(data, sample_count, 0.0f);
        return;
    }

    const ListenerPose listener_pose = pose();
    const bool binaural = m_indirect_binaural.load(std::memory_order_relaxed);
    std::span<float> block(data, sample_count);

    switch (select_mixing_mode(reverb, accelerated)) {
        case MixingMode::AcceleratedMix:
            m_mixer.audio_frame_update(block, channels, m_environmental_renderer.load(std::memory_order_acquire),
                listener_pose, binaural);
            break;

        case MixingMode::RealtimeReverbBlend: {
            std::span<const float> wet = m_simulator.audio_frame_update(block, channels,
                listener_pose.position, listener_pose, true,
                m_reverb_mix_fraction.load(std::memory_order_relaxed), binaural, this);
            if (wet.empty()) break;  // Input left untouched

            const float dry = m_dry_mix_fraction.load(std::memory_order_relaxed);
            const size_t count = std::min(sample_count, wet.size());
            for (size_t i = 0; i < count; ++i) {
                data[i] = data[i] * dry + wet[i];
            }
            break;
        }

        case MixingMode::Disabled:
            break;
    }
}

// ---------------------------------------------------------------------------
// Control
// ---------------------------------------------------------------------------

void ListenerRuntime::flush() {
    m_process_mixed_audio.store(false, std::memory_order_release);
    m_mixer.flush();
    m_simulator.flush();
}

AudioResult ListenerRuntime::begin_bake() {
    if (!m_manager) {
        log(LogLevel::Error, "[ListenerRuntime] Cannot bake reverb without an acoustics manager");
        return AudioResult::failure(AudioError::ManagerMissing, "Acoustics manager not found");
    }

    std::vector<ProbeRegion> regions = m_use_all_probe_regions ? m_manager->probe_regions() : m_probe_regions;
    return m_baker.begin_bake(m_manager->backend(), m_manager->container().environment(),
        m_manager->baking_settings(), std::move(regions), BakingMode::Reverb, kReverbIdentifier);
}

AudioResult ListenerRuntime::end_bake() {
    return m_baker.end_bake();
}

void ListenerRuntime::cancel_bake() {
    m_baker.cancel_bake();
}

bool ListenerRuntime::accelerated_mixing_enabled() const noexcept {
    return m_accelerated_mixing.load(std::memory_order_relaxed);
}

void ListenerRuntime::notify_mixed_audio() noexcept {
    m_process_mixed_audio.store(true, std::memory_order_release);
}

void ListenerRuntime::set_process_mixed_audio(bool process) noexcept {
    m_process_mixed_audio.store(process, std::memory_order_release);
}

bool ListenerRuntime::process_mixed_audio() const noexcept {
    return m_process_mixed_audio.load(std::memory_order_acquire);
}

void ListenerRuntime::set_reverb_enabled(bool enabled) {
    m_enable_reverb.store(enabled);
}

bool ListenerRuntime::reverb_enabled() const {
    return m_enable_reverb.load();
}

void ListenerRuntime::set_accelerated_mixing(bool enabled) {
    m_accelerated_mixing.store(enabled);
}

bool ListenerRuntime::accelerated_mixing() const {
    return m_accelerated_mixing.load();
}

void ListenerRuntime::set_indirect_binaural(bool enabled) {
    m_indirect_binaural.store(enabled);
}

bool ListenerRuntime::indirect_binaural() const {
    return m_indirect_binaural.load();
}

void ListenerRuntime::set_dry_mix_fraction(float fraction) {
    m_dry_mix_fraction.store(std::clamp(fraction, 0.0f, 1.0f));
}

float ListenerRuntime::dry_mix_fraction() const {
    return m_dry_mix_fraction.load();
}

void ListenerRuntime::set_reverb_mix_fraction(float fraction) {
    m_reverb_mix_fraction.store(std::clamp(fraction, 0.0f, 10.0f));
}

float ListenerRuntime::reverb_mix_fraction() const {
    return m_reverb_mix_fraction.load();
}

void ListenerRuntime::set_reverb_simulation_type(ReverbSimulationType type) {
    m_reverb_simulation_type.store(type);
}

ReverbSimulationType ListenerRuntime::reverb_simulation_type() const {
    return m_reverb_simulation_type.load();
}

void ListenerRuntime::set_use_all_probe_regions(bool use_all) {
    m_use_all_probe_regions = use_all;
}

void ListenerRuntime::set_probe_regions(std::vector<ProbeRegion> regions) {
    m_probe_regions = std::move(regions);
}

ListenerPose ListenerRuntime::pose() const {
    return ListenerPose{m_position.load(), m_ahead.load(), m_up.load()};
}

} // namespace acoustics::audio
