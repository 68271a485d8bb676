#include <acoustics/audio/acoustics_manager.hpp>
#include <acoustics/core/log.hpp>
#include <algorithm>

namespace acoustics::audio {

using namespace acoustics::core;

AcousticsManager::AcousticsManager(IAcousticsBackend& backend, AcousticsSettings settings)
    : m_backend(backend)
    , m_settings(std::move(settings))
    , m_container(std::make_unique<EnvironmentContainer>(backend)) {}

AcousticsManager::~AcousticsManager() = default;

void AcousticsManager::initialize(bool initialize_renderer) {
    if (m_initialized && (m_renderer_initialized || !initialize_renderer)) return;

    m_initialized = true;
    m_renderer_initialized = m_renderer_initialized || initialize_renderer;
    log(LogLevel::Info, std::string("[AcousticsManager] Initialized (") +
        std::to_string(m_settings.audio.sample_rate) + " Hz, " +
        std::to_string(m_settings.audio.frame_size) + " frames, " +
        std::to_string(m_settings.audio.channels) + " channels)");
}

AudioFormat AcousticsManager::audio_format() const {
    return AudioFormat::speakers(m_settings.audio.channels);
}

void AcousticsManager::set_static_listener_node(const std::string& node) {
    if (!m_static_listener) {
        m_static_listener = std::make_unique<StaticListener>();
    }
    m_static_listener->current_node = node;
}

void AcousticsManager::clear_static_listener() {
    m_static_listener.reset();
}

void AcousticsManager::set_listener(IMixedAudioListener* listener) {
    if (m_listener && listener && m_listener != listener) {
        log(LogLevel::Warn, "[AcousticsManager] Replacing the active listener; only one listener is supported");
    }
    m_listener = listener;
}

void AcousticsManager::clear_listener(IMixedAudioListener* listener) {
    if (m_listener == listener) {
        m_listener = nullptr;
    }
}

void AcousticsManager::add_probe_region(const ProbeRegion& region) {
    auto it = std::find_if(m_probe_regions.begin(), m_probe_regions.end(),
        [&region](const ProbeRegion& r) { return r.name == region.name; });
    if (it != m_probe_regions.end()) {
        *it = region;
        return;
    }
    m_probe_regions.push_back(region);
}

bool AcousticsManager::remove_probe_region(const std::string& name) {
    return std::erase_if(m_probe_regions, [&name](const ProbeRegion& r) { return r.name == name; }) > 0;
}

} // namespace acoustics::audio
