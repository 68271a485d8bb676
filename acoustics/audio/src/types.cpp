#include <acoustics/audio/types.hpp>

namespace acoustics::audio {

const char* to_string(AudioError error) {
    switch (error) {
        case AudioError::None:                 return "none";
        case AudioError::ManagerMissing:       return "manager missing";
        case AudioError::SceneNotFound:        return "scene not found";
        case AudioError::RendererMissing:      return "renderer missing";
        case AudioError::EffectCreationFailed: return "effect creation failed";
        case AudioError::BakeInProgress:       return "bake in progress";
        case AudioError::BakeFailed:           return "bake failed";
        case AudioError::BakeCancelled:        return "bake cancelled";
        case AudioError::InvalidArgument:      return "invalid argument";
        case AudioError::Unknown:              return "unknown";
    }
    return "unknown";
}

AudioFormat AudioFormat::speakers(uint32_t channels) {
    AudioFormat format;
    format.channels = channels;
    switch (channels) {
        case 1:  format.layout = ChannelLayout::Mono; break;
        case 2:  format.layout = ChannelLayout::Stereo; break;
        case 4:  format.layout = ChannelLayout::Quadraphonic; break;
        case 6:  format.layout = ChannelLayout::FivePointOne; break;
        case 8:  format.layout = ChannelLayout::SevenPointOne; break;
        default: format.layout = ChannelLayout::Stereo; format.channels = 2; break;
    }
    return format;
}

AudioFormat AudioFormat::ambisonics(uint32_t order) {
    AudioFormat format;
    format.layout = ChannelLayout::Ambisonics;
    format.ambisonics_order = order;
    format.channels = (order + 1) * (order + 1);
    return format;
}

} // namespace acoustics::audio
