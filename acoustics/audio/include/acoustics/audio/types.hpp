#pragma once

#include <acoustics/core/math.hpp>
#include <acoustics/core/settings.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace acoustics::audio {

using namespace acoustics::core;

// Stream identifier that namespaces the listener's reverb in the backend and in baked data
inline constexpr const char* kReverbIdentifier = "__reverb__";

// Error codes for control-path operations
enum class AudioError : uint8_t {
    None = 0,
    ManagerMissing,     // No acoustics manager was provided
    SceneNotFound,      // Scene was not exported
    RendererMissing,    // Environmental or binaural renderer unavailable
    EffectCreationFailed,
    BakeInProgress,
    BakeFailed,
    BakeCancelled,
    InvalidArgument,
    Unknown
};

struct AudioResult {
    AudioError error = AudioError::None;
    std::string message;

    bool ok() const { return error == AudioError::None; }
    explicit operator bool() const { return ok(); }

    static AudioResult failure(AudioError e, std::string msg) { return AudioResult{e, std::move(msg)}; }
};

const char* to_string(AudioError error);

// Opaque backend handles. UINT32_MAX means "not available".
struct SceneHandle {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }
};

struct EnvironmentHandle {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }
};

struct EnvironmentalRendererHandle {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }
};

struct BinauralRendererHandle {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }
};

struct EffectHandle {
    uint32_t id = UINT32_MAX;
    bool valid() const { return id != UINT32_MAX; }
};

enum class SimulationType : uint8_t {
    Realtime,
    Baked
};

enum class SourceSimulationType : uint8_t {
    Realtime,
    Baked
};

enum class BakingMode : uint8_t {
    Reverb,
    Propagation
};

enum class ChannelLayout : uint8_t {
    Mono,
    Stereo,
    Quadraphonic,
    FivePointOne,
    SevenPointOne,
    Ambisonics
};

struct AudioFormat {
    ChannelLayout layout = ChannelLayout::Stereo;
    uint32_t channels = 2;
    uint32_t ambisonics_order = 0;

    // Speaker format for an interleaved output with `channels` channels
    static AudioFormat speakers(uint32_t channels);
    // Ambisonics format; (order + 1)^2 channels
    static AudioFormat ambisonics(uint32_t order);
};

// Which baked data set a convolution effect reads from
enum class BakedDataType : uint8_t {
    StaticSource,
    StaticListener,
    Reverb
};

struct BakedDataIdentifier {
    BakedDataType type = BakedDataType::Reverb;
    std::string name;

    bool operator==(const BakedDataIdentifier&) const = default;
};

// Listener position and orientation, world space
struct ListenerPose {
    Vec3 position{0.0f};
    Vec3 ahead{0.0f, 0.0f, -1.0f};
    Vec3 up{0.0f, 1.0f, 0.0f};
};

// Named probe placement volume for baking
struct ProbeRegion {
    std::string name;
    AABB bounds;

    static ProbeRegion from_box(std::string name, const Vec3& center, const Vec3& size) {
        return ProbeRegion{std::move(name), AABB::from_center_size(center, size)};
    }
};

// Non-owning view of an interleaved float block
struct AudioBufferView {
    float* data = nullptr;
    size_t frames = 0;
    uint32_t channels = 0;

    size_t sample_count() const { return frames * channels; }
    bool empty() const { return data == nullptr || sample_count() == 0; }
};

// Implemented by the listener; lets per-source simulators signal that dry audio was
// handed to the environmental mixer during this audio block.
class IMixedAudioListener {
public:
    virtual ~IMixedAudioListener() = default;
    virtual bool accelerated_mixing_enabled() const noexcept = 0;
    virtual void notify_mixed_audio() noexcept = 0;
};

} // namespace acoustics::audio
