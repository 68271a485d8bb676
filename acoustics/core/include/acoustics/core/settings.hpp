#pragma once

#include <cstdint>
#include <string>

namespace acoustics::core {

enum class ReverbSimulationType : uint8_t {
    Realtime,   // Reverb simulated every frame
    Baked       // Reverb looked up from baked probe data
};

enum class ConvolutionType : uint8_t {
    Default,
    TrueAudioNext
};

struct AudioSettings {
    uint32_t sample_rate = 48000;
    uint32_t frame_size = 1024;     // Samples per channel per audio block
    uint32_t channels = 2;
};

struct SimulationSettings {
    uint32_t ambisonics_order = 1;
    uint32_t num_rays = 16384;
    uint32_t num_diffuse_samples = 1024;
    uint32_t num_bounces = 16;
    float ir_duration = 1.0f;       // Seconds
    uint32_t max_convolution_sources = 8;
};

struct RenderingSettings {
    ConvolutionType convolution_type = ConvolutionType::Default;
};

struct BakingSettings {
    float probe_spacing = 2.0f;     // Meters between probes on the grid
    float probe_height = 1.5f;      // Probe height above region floor
    uint32_t num_rays = 16384;
    uint32_t num_bounces = 64;
    float ir_duration = 2.0f;
};

// Initial values for a listener runtime's configuration fields
struct ListenerDefaults {
    bool enable_reverb = false;
    bool accelerated_mixing = false;
    bool indirect_binaural = false;
    float dry_mix_fraction = 1.0f;      // [0, 1]
    float reverb_mix_fraction = 1.0f;   // [0, 10]
    ReverbSimulationType reverb_simulation_type = ReverbSimulationType::Realtime;
    bool use_all_probe_regions = false;
};

struct AcousticsSettings {
    std::string scene_file = "acoustics/scene.phononscene";
    std::string baked_data_directory = "acoustics/baked/";

    AudioSettings audio;
    SimulationSettings simulation;
    RenderingSettings rendering;
    BakingSettings baking;
    ListenerDefaults listener;

    // Load settings from JSON file; false leaves the previous values in place
    bool load(const std::string& path);

    // Parse settings from a JSON document
    bool parse(const std::string& text);

    // Save settings to JSON file
    bool save(const std::string& path) const;

    std::string dump() const;

    void reset();
};

const char* to_string(ReverbSimulationType type);
const char* to_string(ConvolutionType type);

} // namespace acoustics::core
