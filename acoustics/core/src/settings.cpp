#include <acoustics/core/settings.hpp>
#include <acoustics/core/filesystem.hpp>
#include <acoustics/core/log.hpp>
#include <nlohmann/json.hpp>

namespace acoustics::core {

using json = nlohmann::json;

const char* to_string(ReverbSimulationType type) {
    switch (type) {
        case ReverbSimulationType::Realtime: return "realtime";
        case ReverbSimulationType::Baked:    return "baked";
    }
    return "realtime";
}

const char* to_string(ConvolutionType type) {
    switch (type) {
        case ConvolutionType::Default:       return "default";
        case ConvolutionType::TrueAudioNext: return "trueaudionext";
    }
    return "default";
}

static ReverbSimulationType reverb_type_from_string(const std::string& s, ReverbSimulationType fallback) {
    if (s == "realtime") return ReverbSimulationType::Realtime;
    if (s == "baked") return ReverbSimulationType::Baked;
    return fallback;
}

static ConvolutionType convolution_type_from_string(const std::string& s, ConvolutionType fallback) {
    if (s == "default") return ConvolutionType::Default;
    if (s == "trueaudionext") return ConvolutionType::TrueAudioNext;
    return fallback;
}

bool AcousticsSettings::load(const std::string& path) {
    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "[Settings] Could not read " + path + ", using defaults");
        return false;
    }
    return parse(content);
}

bool AcousticsSettings::parse(const std::string& text) {
    AcousticsSettings s = *this;

    try {
        json j = json::parse(text);

        s.scene_file = j.value("scene_file", s.scene_file);
        s.baked_data_directory = j.value("baked_data_directory", s.baked_data_directory);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            s.audio.sample_rate = a.value("sample_rate", s.audio.sample_rate);
            s.audio.frame_size = a.value("frame_size", s.audio.frame_size);
            s.audio.channels = a.value("channels", s.audio.channels);
        }

        if (j.contains("simulation")) {
            auto& sim = j["simulation"];
            s.simulation.ambisonics_order = sim.value("ambisonics_order", s.simulation.ambisonics_order);
            s.simulation.num_rays = sim.value("num_rays", s.simulation.num_rays);
            s.simulation.num_diffuse_samples = sim.value("num_diffuse_samples", s.simulation.num_diffuse_samples);
            s.simulation.num_bounces = sim.value("num_bounces", s.simulation.num_bounces);
            s.simulation.ir_duration = sim.value("ir_duration", s.simulation.ir_duration);
            s.simulation.max_convolution_sources =
                sim.value("max_convolution_sources", s.simulation.max_convolution_sources);
        }

        if (j.contains("rendering")) {
            auto& r = j["rendering"];
            s.rendering.convolution_type = convolution_type_from_string(
                r.value("convolution_type", std::string(to_string(s.rendering.convolution_type))),
                s.rendering.convolution_type);
        }

        if (j.contains("baking")) {
            auto& b = j["baking"];
            s.baking.probe_spacing = b.value("probe_spacing", s.baking.probe_spacing);
            s.baking.probe_height = b.value("probe_height", s.baking.probe_height);
            s.baking.num_rays = b.value("num_rays", s.baking.num_rays);
            s.baking.num_bounces = b.value("num_bounces", s.baking.num_bounces);
            s.baking.ir_duration = b.value("ir_duration", s.baking.ir_duration);
        }

        if (j.contains("listener")) {
            auto& l = j["listener"];
            s.listener.enable_reverb = l.value("enable_reverb", s.listener.enable_reverb);
            s.listener.accelerated_mixing = l.value("accelerated_mixing", s.listener.accelerated_mixing);
            s.listener.indirect_binaural = l.value("indirect_binaural", s.listener.indirect_binaural);
            s.listener.dry_mix_fraction = l.value("dry_mix_fraction", s.listener.dry_mix_fraction);
            s.listener.reverb_mix_fraction = l.value("reverb_mix_fraction", s.listener.reverb_mix_fraction);
            s.listener.reverb_simulation_type = reverb_type_from_string(
                l.value("reverb_simulation_type", std::string(to_string(s.listener.reverb_simulation_type))),
                s.listener.reverb_simulation_type);
            s.listener.use_all_probe_regions = l.value("use_all_probe_regions", s.listener.use_all_probe_regions);
        }
    } catch (const json::exception& e) {
        log(LogLevel::Error, std::string("[Settings] Invalid acoustics settings: ") + e.what());
        return false;
    }

    if (s.audio.channels == 0 || s.audio.frame_size == 0 || s.audio.sample_rate == 0) {
        log(LogLevel::Error, "[Settings] Audio sample rate, frame size and channel count must be non-zero");
        return false;
    }

    *this = std::move(s);
    return true;
}

std::string AcousticsSettings::dump() const {
    json j;

    j["scene_file"] = scene_file;
    j["baked_data_directory"] = baked_data_directory;

    j["audio"] = {
        {"sample_rate", audio.sample_rate},
        {"frame_size", audio.frame_size},
        {"channels", audio.channels}
    };

    j["simulation"] = {
        {"ambisonics_order", simulation.ambisonics_order},
        {"num_rays", simulation.num_rays},
        {"num_diffuse_samples", simulation.num_diffuse_samples},
        {"num_bounces", simulation.num_bounces},
        {"ir_duration", simulation.ir_duration},
        {"max_convolution_sources", simulation.max_convolution_sources}
    };

    j["rendering"] = {
        {"convolution_type", to_string(rendering.convolution_type)}
    };

    j["baking"] = {
        {"probe_spacing", baking.probe_spacing},
        {"probe_height", baking.probe_height},
        {"num_rays", baking.num_rays},
        {"num_bounces", baking.num_bounces},
        {"ir_duration", baking.ir_duration}
    };

    j["listener"] = {
        {"enable_reverb", listener.enable_reverb},
        {"accelerated_mixing", listener.accelerated_mixing},
        {"indirect_binaural", listener.indirect_binaural},
        {"dry_mix_fraction", listener.dry_mix_fraction},
        {"reverb_mix_fraction", listener.reverb_mix_fraction},
        {"reverb_simulation_type", to_string(listener.reverb_simulation_type)},
        {"use_all_probe_regions", listener.use_all_probe_regions}
    };

    return j.dump(4);
}

bool AcousticsSettings::save(const std::string& path) const {
    return FileSystem::write_text(path, dump());
}

void AcousticsSettings::reset() {
    *this = AcousticsSettings{};
}

} // namespace acoustics::core
