#include <acoustics/audio/environment.hpp>
#include <acoustics/core/log.hpp>

namespace acoustics::audio {

using namespace acoustics::core;

EnvironmentContainer::EnvironmentContainer(IAcousticsBackend& backend)
    : m_backend(backend) {}

EnvironmentContainer::~EnvironmentContainer() {
    if (m_ref_count > 0) {
        log(LogLevel::Warn, "[Environment] Container destroyed with outstanding references");
        release_all();
    }
}

void EnvironmentContainer::initialize(bool initialize_renderer, const AcousticsSettings& settings) {
    if (m_ref_count++ > 0) {
        // Later holders may only widen what gets created
        m_initialize_renderer = m_initialize_renderer || initialize_renderer;
        resolve();
        return;
    }

    m_settings = settings;
    m_initialize_renderer = initialize_renderer;
    resolve();
}

void EnvironmentContainer::destroy() {
    if (m_ref_count == 0) return;
    if (--m_ref_count > 0) return;

    release_all();
}

void EnvironmentContainer::resolve() {
    if (m_ref_count == 0 || fully_resolved()) return;

    if (m_initialize_renderer && !m_binaural_renderer.valid()) {
        m_binaural_renderer = m_backend.create_binaural_renderer(m_settings.rendering);
        if (!m_binaural_renderer.valid()) {
            log(LogLevel::Debug, "[Environment] Binaural renderer not available yet");
        }
    }

    if (!m_scene.valid()) {
        m_scene = m_backend.load_scene(m_settings.scene_file);
        if (!m_scene.valid()) return;
        log(LogLevel::Info, "[Environment] Loaded scene " + m_settings.scene_file);
    }

    if (!m_environment.valid()) {
        m_environment = m_backend.create_environment(m_scene, m_settings.simulation);
        if (!m_environment.valid()) return;
    }

    if (m_initialize_renderer && !m_environmental_renderer.valid()) {
        m_environmental_renderer = m_backend.create_environmental_renderer(
            m_environment, m_settings.rendering, AudioFormat::speakers(m_settings.audio.channels));
        if (m_environmental_renderer.valid()) {
            log(LogLevel::Info, "[Environment] Environmental renderer created");
        }
    }
}

bool EnvironmentContainer::fully_resolved() const {
    if (!m_scene.valid() || !m_environment.valid()) return false;
    if (m_initialize_renderer) {
        return m_binaural_renderer.valid() && m_environmental_renderer.valid();
    }
    return true;
}

void EnvironmentContainer::release_all() {
    if (m_environmental_renderer.valid()) m_backend.release_environmental_renderer(m_environmental_renderer);
    if (m_environment.valid()) m_backend.release_environment(m_environment);
    if (m_scene.valid()) m_backend.release_scene(m_scene);
    if (m_binaural_renderer.valid()) m_backend.release_binaural_renderer(m_binaural_renderer);

    m_environmental_renderer = {};
    m_environment = {};
    m_scene = {};
    m_binaural_renderer = {};
    m_ref_count = 0;
}

} // namespace acoustics::audio
