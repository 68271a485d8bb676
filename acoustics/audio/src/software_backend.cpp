#include <acoustics/audio/software_backend.hpp>
#include <acoustics/core/filesystem.hpp>
#include <acoustics/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace acoustics::audio {

using namespace acoustics::core;
using json = nlohmann::json;

// Freeverb tunings, in samples at 44100 Hz
static constexpr int kCombTuning[] = { 1116, 1188, 1277, 1356, 1422, 1491, 1557, 1617 };
static constexpr int kAllpassTuning[] = { 556, 441, 341, 225 };
static constexpr float kTankInputGain = 0.015f;

// Largest block accepted by set_dry_audio(), in frames
static constexpr size_t kMaxTailFrames = 4096;

// Share of the tail encoded towards the source; the rest stays diffuse (W only)
static constexpr float kDirectivity = 0.5f;

static constexpr float kPi = 3.14159265358979f;

static Vec3 safe_normalize(const Vec3& v, const Vec3& fallback) {
    float len = glm::length(v);
    return len > 1e-6f ? v / len : fallback;
}

// Horizontal speaker azimuths in radians, counter-clockwise from ahead. NaN marks the LFE.
static float speaker_azimuth(uint32_t channels, uint32_t channel) {
    const float lfe = std::nanf("");
    auto deg = [](float d) { return d * kPi / 180.0f; };

    switch (channels) {
        case 2: {
            static const float az[] = { 30.0f, -30.0f };
            return deg(az[channel]);
        }
        case 4: {
            static const float az[] = { 45.0f, -45.0f, 135.0f, -135.0f };
            return deg(az[channel]);
        }
        case 6: {
            if (channel == 3) return lfe;
            static const float az[] = { 30.0f, -30.0f, 0.0f, 0.0f, 110.0f, -110.0f };
            return deg(az[channel]);
        }
        case 8: {
            if (channel == 3) return lfe;
            static const float az[] = { 30.0f, -30.0f, 0.0f, 0.0f, 135.0f, -135.0f, 90.0f, -90.0f };
            return deg(az[channel]);
        }
        default:
            return 0.0f;
    }
}

// ---------------------------------------------------------------------------
// Reverb tank
// ---------------------------------------------------------------------------

float SoftwareBackend::CombFilter::process(float input) {
    float output = buffer[index];
    filter_store = (output * damp2) + (filter_store * damp1);
    buffer[index] = input + (filter_store * feedback);

    if (++index >= buffer.size()) index = 0;
    return output;
}

float SoftwareBackend::AllpassFilter::process(float input) {
    float buffered = buffer[index];
    float output = -input + buffered;
    buffer[index] = input + (buffered * feedback);

    if (++index >= buffer.size()) index = 0;
    return output;
}

void SoftwareBackend::ReverbTank::configure(uint32_t sample_rate, float room_size, float damping) {
    const float scale = static_cast<float>(sample_rate) / 44100.0f;
    const float feedback = 0.28f + std::clamp(room_size, 0.0f, 1.0f) * 0.7f;
    damping = std::clamp(damping, 0.0f, 1.0f);

    for (int i = 0; i < kNumCombs; ++i) {
        auto& comb = combs[i];
        comb.buffer.assign(std::max<size_t>(1, static_cast<size_t>(kCombTuning[i] * scale)), 0.0f);
        comb.index = 0;
        comb.filter_store = 0.0f;
        comb.feedback = feedback;
        comb.damp1 = damping;
        comb.damp2 = 1.0f - damping;
    }
    for (int i = 0; i < kNumAllpass; ++i) {
        auto& allpass = allpasses[i];
        allpass.buffer.assign(std::max<size_t>(1, static_cast<size_t>(kAllpassTuning[i] * scale)), 0.0f);
        allpass.index = 0;
        allpass.feedback = 0.5f;
    }
}

float SoftwareBackend::ReverbTank::process(float input) {
    float out = 0.0f;
    for (auto& comb : combs) {
        out += comb.process(input * kTankInputGain);
    }
    for (auto& allpass : allpasses) {
        out = allpass.process(out);
    }
    return out;
}

void SoftwareBackend::ReverbTank::clear() {
    for (auto& comb : combs) {
        std::fill(comb.buffer.begin(), comb.buffer.end(), 0.0f);
        comb.filter_store = 0.0f;
    }
    for (auto& allpass : allpasses) {
        std::fill(allpass.buffer.begin(), allpass.buffer.end(), 0.0f);
    }
}

// ---------------------------------------------------------------------------
// Scene and renderers
// ---------------------------------------------------------------------------

SoftwareBackend::SoftwareBackend(const AudioSettings& audio_settings)
    : m_audio_settings(audio_settings) {}

SoftwareBackend::~SoftwareBackend() = default;

SceneHandle SoftwareBackend::load_scene(const std::string& path) {
    // Polled every frame until the scene is exported; stays quiet
    if (!FileSystem::exists(path)) return SceneHandle{};

    RoomParams room;
    try {
        json j = json::parse(FileSystem::read_text(path));
        if (j.contains("reverb")) {
            auto& r = j["reverb"];
            room.room_size = r.value("room_size", room.room_size);
            room.damping = r.value("damping", room.damping);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Warn, "[SoftwareBackend] Scene " + path + " has no readable reverb parameters: " + e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    SceneHandle scene{next_id()};
    m_scenes[scene.id] = room;
    return scene;
}

void SoftwareBackend::release_scene(SceneHandle& scene) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scenes.erase(scene.id);
    scene = {};
}

EnvironmentHandle SoftwareBackend::create_environment(SceneHandle scene, const SimulationSettings& /*settings*/) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_scenes.find(scene.id);
    if (it == m_scenes.end()) return EnvironmentHandle{};

    EnvironmentHandle environment{next_id()};
    m_environments[environment.id] = EnvironmentRecord{scene.id, it->second};
    return environment;
}

void SoftwareBackend::release_environment(EnvironmentHandle& environment) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_environments.erase(environment.id);
    environment = {};
}

EnvironmentalRendererHandle SoftwareBackend::create_environmental_renderer(EnvironmentHandle environment,
                                                                           const RenderingSettings& /*settings*/,
                                                                           const AudioFormat& output_format) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_environments.contains(environment.id)) return EnvironmentalRendererHandle{};

    EnvironmentalRendererHandle renderer{next_id()};
    m_renderers[renderer.id] = RendererRecord{environment.id, output_format};
    return renderer;
}

void SoftwareBackend::release_environmental_renderer(EnvironmentalRendererHandle& renderer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_renderers.erase(renderer.id);
    renderer = {};
}

BinauralRendererHandle SoftwareBackend::create_binaural_renderer(const RenderingSettings& /*settings*/) {
    std::lock_guard<std::mutex> lock(m_mutex);
    BinauralRendererHandle renderer{next_id()};
    m_binaural_renderers.insert(renderer.id);
    return renderer;
}

void SoftwareBackend::release_binaural_renderer(BinauralRendererHandle& renderer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_binaural_renderers.erase(renderer.id);
    renderer = {};
}

// ---------------------------------------------------------------------------
// Effects
// ---------------------------------------------------------------------------

AudioResult SoftwareBackend::create_ambisonics_binaural_effect(BinauralRendererHandle renderer,
                                                               const AudioFormat& input_format,
                                                               const AudioFormat& output_format,
                                                               EffectHandle& effect) {
    if (output_format.channels != 2) {
        return AudioResult::failure(AudioError::InvalidArgument, "Binaural output must be stereo");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_binaural_renderers.contains(renderer.id)) {
        return AudioResult::failure(AudioError::RendererMissing, "Binaural renderer not found");
    }

    auto e = std::make_unique<Effect>();
    e->kind = EffectKind::AmbisonicsBinaural;
    e->input_format = input_format;
    e->output_format = output_format;

    effect = EffectHandle{next_id()};
    m_effects[effect.id] = std::move(e);
    return {};
}

AudioResult SoftwareBackend::create_ambisonics_panning_effect(BinauralRendererHandle renderer,
                                                              const AudioFormat& input_format,
                                                              const AudioFormat& output_format,
                                                              EffectHandle& effect) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_binaural_renderers.contains(renderer.id)) {
        return AudioResult::failure(AudioError::RendererMissing, "Binaural renderer not found");
    }

    auto e = std::make_unique<Effect>();
    e->kind = EffectKind::AmbisonicsPanning;
    e->input_format = input_format;
    e->output_format = output_format;

    effect = EffectHandle{next_id()};
    m_effects[effect.id] = std::move(e);
    return {};
}

AudioResult SoftwareBackend::create_convolution_effect(EnvironmentalRendererHandle renderer,
                                                       const std::string& identifier,
                                                       SimulationType simulation_type,
                                                       const AudioFormat& input_format,
                                                       const AudioFormat& output_format,
                                                       EffectHandle& effect) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto renderer_it = m_renderers.find(renderer.id);
    if (renderer_it == m_renderers.end()) {
        return AudioResult::failure(AudioError::RendererMissing, "Environmental renderer not found");
    }
    auto env_it = m_environments.find(renderer_it->second.environment_id);
    if (env_it == m_environments.end()) {
        return AudioResult::failure(AudioError::SceneNotFound, "Environment of the renderer was released");
    }

    auto e = std::make_unique<Effect>();
    e->kind = EffectKind::Convolution;
    e->input_format = input_format;
    e->output_format = output_format;
    e->renderer_id = renderer.id;
    e->identifier = identifier;
    e->simulation_type = simulation_type;
    e->baked_identifier = {BakedDataType::Reverb, identifier};
    e->tank.configure(m_audio_settings.sample_rate, env_it->second.room.room_size, env_it->second.room.damping);
    e->tail.assign(kMaxTailFrames, 0.0f);

    effect = EffectHandle{next_id()};
    m_effects[effect.id] = std::move(e);
    return {};
}

SoftwareBackend::Effect* SoftwareBackend::find_effect(EffectHandle handle, EffectKind kind) {
    auto it = m_effects.find(handle.id);
    if (it == m_effects.end() || it->second->kind != kind) return nullptr;
    return it->second.get();
}

void SoftwareBackend::set_baked_identifier(EffectHandle convolution, const BakedDataIdentifier& identifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (Effect* e = find_effect(convolution, EffectKind::Convolution)) {
        e->baked_identifier = identifier;
    }
}

void SoftwareBackend::flush_effect(EffectHandle effect) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (Effect* e = find_effect(effect, EffectKind::Convolution)) {
        e->tank.clear();
        std::fill(e->tail.begin(), e->tail.end(), 0.0f);
        e->tail_frames = 0;
    }
}

void SoftwareBackend::destroy_effect(EffectHandle& effect) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_effects.erase(effect.id);
    effect = {};
}

// ---------------------------------------------------------------------------
// Audio thread
// ---------------------------------------------------------------------------

void SoftwareBackend::set_dry_audio(EffectHandle convolution, const Vec3& source_position,
                                    AudioBufferView dry) noexcept {
    std::lock_guard<std::mutex> lock(m_mutex);
    Effect* e = find_effect(convolution, EffectKind::Convolution);
    if (!e || dry.empty()) return;

    const size_t frames = std::min(dry.frames, e->tail.size());
    const float inv_channels = 1.0f / static_cast<float>(dry.channels);
    for (size_t i = 0; i < frames; ++i) {
        float mono = 0.0f;
        for (uint32_t c = 0; c < dry.channels; ++c) {
            mono += dry.data[i * dry.channels + c];
        }
        e->tail[i] = e->tank.process(mono * inv_channels);
    }
    e->tail_frames = frames;
    e->source_position = source_position;
}

bool SoftwareBackend::tail_audible(const Effect& effect) const {
    if (effect.simulation_type == SimulationType::Realtime) return true;
    return m_baked_probes.contains(effect.baked_identifier.name);
}

void SoftwareBackend::encode_tail(const Effect& effect, const ListenerPose& listener, float gain,
                                  AudioBufferView out, bool accumulate) const {
    if (!accumulate) {
        std::fill_n(out.data, out.sample_count(), 0.0f);
    }

    // Source direction in the listener frame: x ahead, y left, z up
    Vec3 delta = effect.source_position - listener.position;
    float distance = glm::length(delta);
    Vec3 local{0.0f};
    if (distance > 1e-4f) {
        Vec3 ahead = safe_normalize(listener.ahead, Vec3{0.0f, 0.0f, -1.0f});
        Vec3 up = safe_normalize(listener.up, Vec3{0.0f, 1.0f, 0.0f});
        Vec3 right = safe_normalize(glm::cross(ahead, up), Vec3{1.0f, 0.0f, 0.0f});
        Vec3 dir = delta / distance;
        local = Vec3{glm::dot(dir, ahead), -glm::dot(dir, right), glm::dot(dir, up)};
    }
    const float attenuation = gain / std::max(1.0f, distance);

    const size_t frames = std::min(out.frames, effect.tail_frames);
    for (size_t i = 0; i < frames; ++i) {
        float s = effect.tail[i] * attenuation;
        float* frame = out.data + i * out.channels;
        frame[0] += s;
        if (out.channels >= 4) {
            frame[1] += s * kDirectivity * local.y;     // ACN 1: Y
            frame[2] += s * kDirectivity * local.z;     // ACN 2: Z
            frame[3] += s * kDirectivity * local.x;     // ACN 3: X
        }
    }
}

void SoftwareBackend::get_wet_audio(EffectHandle convolution, const ListenerPose& listener,
                                    AudioBufferView wet_ambisonics) noexcept {
    if (wet_ambisonics.empty()) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    Effect* e = find_effect(convolution, EffectKind::Convolution);
    if (!e || !tail_audible(*e)) {
        std::fill_n(wet_ambisonics.data, wet_ambisonics.sample_count(), 0.0f);
        return;
    }
    encode_tail(*e, listener, 1.0f, wet_ambisonics, false);
}

void SoftwareBackend::get_mixed_environmental_audio(EnvironmentalRendererHandle renderer,
                                                    const ListenerPose& listener,
                                                    AudioBufferView mixed_ambisonics) noexcept {
    if (mixed_ambisonics.empty()) return;
    std::fill_n(mixed_ambisonics.data, mixed_ambisonics.sample_count(), 0.0f);

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, effect] : m_effects) {
        if (effect->kind != EffectKind::Convolution || effect->renderer_id != renderer.id) continue;
        if (!tail_audible(*effect)) continue;
        encode_tail(*effect, listener, 1.0f, mixed_ambisonics, true);
    }
}

void SoftwareBackend::apply_ambisonics_binaural(EffectHandle effect, AudioBufferView input,
                                                AudioBufferView output) noexcept {
    if (output.empty()) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!find_effect(effect, EffectKind::AmbisonicsBinaural)) return;
    }

    const size_t frames = std::min(input.frames, output.frames);
    std::fill_n(output.data, output.sample_count(), 0.0f);
    if (input.empty()) return;

    // Virtual cardioids at the ears
    for (size_t i = 0; i < frames; ++i) {
        const float* in = input.data + i * input.channels;
        float w = in[0];
        float y = input.channels >= 4 ? in[1] : 0.0f;
        float* out = output.data + i * output.channels;
        out[0] = 0.5f * (w + y);
        if (output.channels > 1) out[1] = 0.5f * (w - y);
    }
}

void SoftwareBackend::apply_ambisonics_panning(EffectHandle effect, AudioBufferView input,
                                               AudioBufferView output) noexcept {
    if (output.empty()) return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!find_effect(effect, EffectKind::AmbisonicsPanning)) return;
    }

    const size_t frames = std::min(input.frames, output.frames);
    std::fill_n(output.data, output.sample_count(), 0.0f);
    if (input.empty()) return;

    for (size_t i = 0; i < frames; ++i) {
        const float* in = input.data + i * input.channels;
        float w = in[0];
        float y = input.channels >= 4 ? in[1] : 0.0f;
        float x = input.channels >= 4 ? in[3] : 0.0f;
        float* out = output.data + i * output.channels;

        if (output.channels == 1) {
            out[0] = w;
            continue;
        }
        for (uint32_t c = 0; c < output.channels; ++c) {
            float az = speaker_azimuth(output.channels, c);
            if (std::isnan(az)) continue;   // LFE
            out[c] = 0.5f * (w + x * std::cos(az) + y * std::sin(az));
        }
    }
}

// ---------------------------------------------------------------------------
// Baking
// ---------------------------------------------------------------------------

namespace {

struct GridCells {
    uint64_t nx = 1;
    uint64_t nz = 1;
    bool oversized = false;
};

GridCells grid_cells(const ProbeRegion& region, const BakingSettings& settings) {
    const double spacing = std::max(static_cast<double>(settings.probe_spacing), 0.01);
    const Vec3 size = region.bounds.size();
    const double limit = static_cast<double>(SoftwareBackend::kMaxProbesPerRegion);

    const double fx = std::floor(static_cast<double>(size.x) / spacing);
    const double fz = std::floor(static_cast<double>(size.z) / spacing);

    GridCells cells;
    // Negated so NaN extents fail the check too
    if (!(fx <= limit) || !(fz <= limit)) {
        cells.oversized = true;
        return cells;
    }
    cells.nx = std::max<uint64_t>(1, static_cast<uint64_t>(std::max(fx, 0.0)));
    cells.nz = std::max<uint64_t>(1, static_cast<uint64_t>(std::max(fz, 0.0)));
    cells.oversized = cells.nx * cells.nz > SoftwareBackend::kMaxProbesPerRegion;
    return cells;
}

} // namespace

uint64_t SoftwareBackend::probe_count(const ProbeRegion& region, const BakingSettings& settings) {
    GridCells cells = grid_cells(region, settings);
    if (cells.oversized) return UINT64_MAX;
    return cells.nx * cells.nz;
}

std::vector<Vec3> SoftwareBackend::probe_grid(const ProbeRegion& region, const BakingSettings& settings) {
    GridCells cells = grid_cells(region, settings);
    if (cells.oversized) return {};

    const Vec3 size = region.bounds.size();
    const float y = std::min(region.bounds.min.y + settings.probe_height, region.bounds.max.y);
    const float nx = static_cast<float>(cells.nx);
    const float nz = static_cast<float>(cells.nz);

    std::vector<Vec3> probes;
    probes.reserve(static_cast<size_t>(cells.nx * cells.nz));
    for (uint64_t ix = 0; ix < cells.nx; ++ix) {
        for (uint64_t iz = 0; iz < cells.nz; ++iz) {
            probes.emplace_back(
                region.bounds.min.x + (static_cast<float>(ix) + 0.5f) * size.x / nx,
                y,
                region.bounds.min.z + (static_cast<float>(iz) + 0.5f) * size.z / nz);
        }
    }
    return probes;
}

AudioResult SoftwareBackend::bake_reverb(EnvironmentHandle environment, const ProbeRegion& region,
                                         BakingMode /*mode*/, const BakingSettings& settings,
                                         const std::string& identifier, const BakeProgressFn& progress) {
    m_cancel_bake = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_environments.contains(environment.id)) {
            return AudioResult::failure(AudioError::SceneNotFound, "Environment not found");
        }
    }

    const uint64_t count = probe_count(region, settings);
    if (count > kMaxProbesPerRegion) {
        log(LogLevel::Error, "[SoftwareBackend] Probe grid of " + region.name + " is too dense at " +
            std::to_string(settings.probe_spacing) + " m spacing");
        return AudioResult::failure(AudioError::InvalidArgument,
            "Probe grid exceeds " + std::to_string(kMaxProbesPerRegion) + " probes");
    }

    std::vector<Vec3> probes = probe_grid(region, settings);
    for (size_t i = 0; i < probes.size(); ++i) {
        if (m_cancel_bake) {
            return AudioResult::failure(AudioError::BakeCancelled, "Cancelled");
        }
        if (progress) {
            progress(static_cast<float>(i + 1) / static_cast<float>(probes.size()));
        }
    }

    log(LogLevel::Info, "[SoftwareBackend] Baked " + std::to_string(probes.size()) + " probe(s) in " +
        region.name + " for " + identifier);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_baked_probes[identifier][region.name] = std::move(probes);
    return {};
}

void SoftwareBackend::cancel_bake() {
    m_cancel_bake = true;
}

size_t SoftwareBackend::effect_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_effects.size();
}

bool SoftwareBackend::has_baked_data(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_baked_probes.contains(identifier);
}

size_t SoftwareBackend::baked_probe_count(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_baked_probes.find(identifier);
    if (it == m_baked_probes.end()) return 0;

    size_t count = 0;
    for (const auto& [region, probes] : it->second) {
        count += probes.size();
    }
    return count;
}

} // namespace acoustics::audio
