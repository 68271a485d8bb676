#pragma once

#include <acoustics/audio/backend.hpp>
#include <acoustics/audio/environment.hpp>
#include <acoustics/core/settings.hpp>
#include <memory>
#include <string>
#include <vector>

namespace acoustics::audio {

using namespace acoustics::core;

// Listener node that baked reverb is currently looked up for
struct StaticListener {
    std::string current_node;

    bool has_node() const { return !current_node.empty(); }
};

// Scene-wide acoustics state: settings, backend, the shared environment container,
// the static listener and the probe-region registry. Passed explicitly to every
// listener and source that needs it.
class AcousticsManager {
public:
    AcousticsManager(IAcousticsBackend& backend, AcousticsSettings settings);
    ~AcousticsManager();

    AcousticsManager(const AcousticsManager&) = delete;
    AcousticsManager& operator=(const AcousticsManager&) = delete;

    // Idempotent; the renderer flag only widens
    void initialize(bool initialize_renderer);
    bool initialized() const { return m_initialized; }

    IAcousticsBackend& backend() { return m_backend; }
    EnvironmentContainer& container() { return *m_container; }

    const AcousticsSettings& settings() const { return m_settings; }
    AudioFormat audio_format() const;
    const SimulationSettings& simulation_settings() const { return m_settings.simulation; }
    const RenderingSettings& rendering_settings() const { return m_settings.rendering; }
    const BakingSettings& baking_settings() const { return m_settings.baking; }

    StaticListener* static_listener() { return m_static_listener.get(); }
    void set_static_listener_node(const std::string& node);
    void clear_static_listener();

    // The active listener, if one is attached
    IMixedAudioListener* listener() const { return m_listener; }
    void set_listener(IMixedAudioListener* listener);
    void clear_listener(IMixedAudioListener* listener);

    // Host-wide probe-region registry
    void add_probe_region(const ProbeRegion& region);
    bool remove_probe_region(const std::string& name);
    const std::vector<ProbeRegion>& probe_regions() const { return m_probe_regions; }

private:
    IAcousticsBackend& m_backend;
    AcousticsSettings m_settings;
    std::unique_ptr<EnvironmentContainer> m_container;
    std::unique_ptr<StaticListener> m_static_listener;
    IMixedAudioListener* m_listener = nullptr;
    std::vector<ProbeRegion> m_probe_regions;
    bool m_initialized = false;
    bool m_renderer_initialized = false;
};

} // namespace acoustics::audio
