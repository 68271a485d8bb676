#include <catch2/catch_test_macros.hpp>
#include <acoustics/audio/types.hpp>
#include <string>

using namespace acoustics::audio;

TEST_CASE("AudioFormat speaker layouts", "[audio][types]") {
    REQUIRE(AudioFormat::speakers(1).layout == ChannelLayout::Mono);
    REQUIRE(AudioFormat::speakers(2).layout == ChannelLayout::Stereo);
    REQUIRE(AudioFormat::speakers(4).layout == ChannelLayout::Quadraphonic);
    REQUIRE(AudioFormat::speakers(6).layout == ChannelLayout::FivePointOne);
    REQUIRE(AudioFormat::speakers(8).layout == ChannelLayout::SevenPointOne);

    SECTION("Unsupported counts fall back to stereo") {
        AudioFormat format = AudioFormat::speakers(3);
        REQUIRE(format.layout == ChannelLayout::Stereo);
        REQUIRE(format.channels == 2);
    }
}

TEST_CASE("AudioFormat ambisonics channel count", "[audio][types]") {
    REQUIRE(AudioFormat::ambisonics(0).channels == 1);
    REQUIRE(AudioFormat::ambisonics(1).channels == 4);
    REQUIRE(AudioFormat::ambisonics(2).channels == 9);
    REQUIRE(AudioFormat::ambisonics(3).channels == 16);
    REQUIRE(AudioFormat::ambisonics(2).layout == ChannelLayout::Ambisonics);
}

TEST_CASE("Handles default to invalid", "[audio][types]") {
    REQUIRE_FALSE(SceneHandle{}.valid());
    REQUIRE_FALSE(EnvironmentHandle{}.valid());
    REQUIRE_FALSE(EnvironmentalRendererHandle{}.valid());
    REQUIRE_FALSE(BinauralRendererHandle{}.valid());
    REQUIRE_FALSE(EffectHandle{}.valid());
    REQUIRE(EffectHandle{0}.valid());
}

TEST_CASE("AudioResult", "[audio][types]") {
    AudioResult ok;
    REQUIRE(ok.ok());
    REQUIRE(static_cast<bool>(ok));

    auto failed = AudioResult::failure(AudioError::RendererMissing, "no renderer");
    REQUIRE_FALSE(failed);
    REQUIRE(failed.message == "no renderer");
    REQUIRE(std::string(to_string(failed.error)) == "renderer missing");
}

TEST_CASE("BakedDataIdentifier equality", "[audio][types]") {
    BakedDataIdentifier a{BakedDataType::Reverb, kReverbIdentifier};
    BakedDataIdentifier b{BakedDataType::Reverb, kReverbIdentifier};
    BakedDataIdentifier c{BakedDataType::StaticListener, kReverbIdentifier};

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
}

TEST_CASE("AudioBufferView sizes", "[audio][types]") {
    float samples[8] = {};
    AudioBufferView view{samples, 4, 2};
    REQUIRE(view.sample_count() == 8);
    REQUIRE_FALSE(view.empty());
    REQUIRE(AudioBufferView{}.empty());
    REQUIRE(AudioBufferView{samples, 0, 2}.empty());
}
