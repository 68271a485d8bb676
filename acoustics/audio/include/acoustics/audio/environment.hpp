#pragma once

#include <acoustics/audio/backend.hpp>
#include <acoustics/core/settings.hpp>
#include <cstdint>

namespace acoustics::audio {

using namespace acoustics::core;

// Scene, environment and renderer objects shared by every listener and source of one
// acoustics manager. Reference counted: the first initialize() creates what it can,
// the last destroy() releases everything.
//
// Objects that cannot be created yet (scene not exported, streaming not finished) are
// retried by resolve(), which listeners call every frame until everything is valid.
class EnvironmentContainer {
public:
    explicit EnvironmentContainer(IAcousticsBackend& backend);
    ~EnvironmentContainer();

    EnvironmentContainer(const EnvironmentContainer&) = delete;
    EnvironmentContainer& operator=(const EnvironmentContainer&) = delete;

    void initialize(bool initialize_renderer, const AcousticsSettings& settings);
    void destroy();

    // Create whatever is still missing. Cheap once everything is valid.
    void resolve();

    SceneHandle scene() const { return m_scene; }
    EnvironmentHandle environment() const { return m_environment; }
    EnvironmentalRendererHandle environmental_renderer() const { return m_environmental_renderer; }
    BinauralRendererHandle binaural_renderer() const { return m_binaural_renderer; }

    uint32_t ref_count() const { return m_ref_count; }
    bool fully_resolved() const;

private:
    void release_all();

    IAcousticsBackend& m_backend;
    AcousticsSettings m_settings;
    bool m_initialize_renderer = false;
    uint32_t m_ref_count = 0;

    SceneHandle m_scene;
    EnvironmentHandle m_environment;
    EnvironmentalRendererHandle m_environmental_renderer;
    BinauralRendererHandle m_binaural_renderer;
};

} // namespace acoustics::audio
