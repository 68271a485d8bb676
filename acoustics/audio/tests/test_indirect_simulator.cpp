#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <acoustics/audio/indirect_simulator.hpp>
#include "fake_backend.hpp"
#include <vector>

using namespace acoustics::audio;
using namespace acoustics::audio::testing;
using namespace acoustics::core;
using Catch::Matchers::WithinAbs;

namespace {

struct MixedAudioProbe : IMixedAudioListener {
    bool accelerated = false;
    int notifications = 0;

    bool accelerated_mixing_enabled() const noexcept override { return accelerated; }
    void notify_mixed_audio() noexcept override { ++notifications; }
};

class SimulatorFixture {
protected:
    SimulatorFixture() {
        simulator.initialize(backend, AudioFormat::speakers(2), SimulationSettings{});
    }

    void lazy_init(bool reverb = true,
                   ReverbSimulationType type = ReverbSimulationType::Realtime,
                   EnvironmentalRendererHandle renderer = EnvironmentalRendererHandle{7}) {
        simulator.lazy_initialize(BinauralRendererHandle{3}, reverb, false, RenderingSettings{},
            false, SourceSimulationType::Realtime, kReverbIdentifier, nullptr, type, renderer);
    }

    std::span<const float> process(const std::vector<float>& block, float mix, bool binaural,
                                   IMixedAudioListener* listener = nullptr) {
        return simulator.audio_frame_update(block, 2, Vec3{0.0f}, ListenerPose{}, true, mix, binaural, listener);
    }

    FakeBackend backend;
    IndirectSimulator simulator;
};

} // namespace

TEST_CASE_METHOD(SimulatorFixture, "IndirectSimulator lazy initialization", "[audio][simulator]") {
    SECTION("Creates decoders and the convolution effect once") {
        lazy_init();
        lazy_init();
        lazy_init();

        REQUIRE(simulator.has_convolution_effect());
        REQUIRE(backend.binaural_effects_created == 1);
        REQUIRE(backend.panning_effects_created == 1);
        REQUIRE(backend.convolution_effects_created == 1);
        REQUIRE(backend.last_convolution_identifier == kReverbIdentifier);
        REQUIRE(backend.last_simulation_type == SimulationType::Realtime);
    }

    SECTION("Nothing is created while reverb is off") {
        lazy_init(false);
        REQUIRE_FALSE(simulator.has_convolution_effect());
        REQUIRE(backend.live_effects() == 0);
    }

    SECTION("Waits for the environmental renderer") {
        lazy_init(true, ReverbSimulationType::Realtime, EnvironmentalRendererHandle{});
        REQUIRE_FALSE(simulator.has_convolution_effect());
        REQUIRE(backend.panning_effects_created == 1);

        lazy_init();
        REQUIRE(simulator.has_convolution_effect());
        REQUIRE(backend.panning_effects_created == 1);
    }

    SECTION("Baked reverb creates a baked convolution effect") {
        lazy_init(true, ReverbSimulationType::Baked);
        REQUIRE(backend.last_simulation_type == SimulationType::Baked);
    }

    SECTION("Creation failures are logged once") {
        CategoryCounter errors("IndirectSimulator", LogLevel::Error);
        backend.fail_convolution_effect = true;

        for (int i = 0; i < 10; ++i) lazy_init();

        REQUIRE_FALSE(simulator.has_convolution_effect());
        REQUIRE(errors.count() == 1);

        backend.fail_convolution_effect = false;
        lazy_init();
        REQUIRE(simulator.has_convolution_effect());
    }
}

TEST_CASE_METHOD(SimulatorFixture, "IndirectSimulator wet output", "[audio][simulator]") {
    std::vector<float> block(8, 1.0f);

    SECTION("Empty until the convolution effect exists") {
        REQUIRE(process(block, 1.0f, false).empty());
        REQUIRE(backend.dry_calls == 0);
    }

    lazy_init();
    backend.wet_value = 0.2f;

    SECTION("Wet is scaled by the mix fraction") {
        auto wet = process(block, 0.5f, false);
        REQUIRE(wet.size() == block.size());
        for (float s : wet) REQUIRE_THAT(s, WithinAbs(0.1f, 0.0001f));
        REQUIRE(backend.dry_calls == 1);
        REQUIRE(backend.panning_calls == 1);
        REQUIRE(backend.binaural_calls == 0);
    }

    SECTION("Binaural decode for stereo output") {
        auto wet = process(block, 1.0f, true);
        REQUIRE(wet.size() == block.size());
        REQUIRE(backend.binaural_calls == 1);
        REQUIRE(backend.panning_calls == 0);
    }

    SECTION("Reflections disabled") {
        auto wet = simulator.audio_frame_update(block, 2, Vec3{0.0f}, ListenerPose{}, false, 1.0f, false, nullptr);
        REQUIRE(wet.empty());
    }

    SECTION("Blocks larger than the scratch buffers produce nothing") {
        std::vector<float> huge(2 * 8192, 1.0f);
        REQUIRE(process(huge, 1.0f, false).empty());
    }

    SECTION("Accelerated mixing hands the dry audio to the mixer") {
        MixedAudioProbe listener;
        listener.accelerated = true;
        simulator.frame_update(true, SourceSimulationType::Realtime, ReverbSimulationType::Realtime, nullptr, &listener);

        auto wet = process(block, 1.0f, false, &listener);
        REQUIRE(wet.empty());
        REQUIRE(listener.notifications == 1);
        REQUIRE(backend.dry_calls == 1);
        REQUIRE(backend.wet_calls == 0);
    }
}

TEST_CASE_METHOD(SimulatorFixture, "IndirectSimulator baked data selection", "[audio][simulator]") {
    lazy_init(true, ReverbSimulationType::Baked);

    SECTION("Listener reverb without a static listener") {
        simulator.frame_update(false, SourceSimulationType::Realtime, ReverbSimulationType::Baked, nullptr, nullptr);
        REQUIRE(backend.last_baked_identifier.type == BakedDataType::Reverb);
        REQUIRE(backend.last_baked_identifier.name == kReverbIdentifier);
    }

    SECTION("Static listener node wins") {
        StaticListener static_listener{"stage"};
        simulator.frame_update(false, SourceSimulationType::Realtime, ReverbSimulationType::Baked,
            &static_listener, nullptr);
        REQUIRE(backend.last_baked_identifier.type == BakedDataType::StaticListener);
        REQUIRE(backend.last_baked_identifier.name == "stage");

        static_listener.current_node = "balcony";
        simulator.frame_update(false, SourceSimulationType::Realtime, ReverbSimulationType::Baked,
            &static_listener, nullptr);
        REQUIRE(backend.last_baked_identifier.name == "balcony");
        REQUIRE(backend.baked_identifier_updates == 2);
    }

    SECTION("Baked sources use the static source data") {
        simulator.frame_update(true, SourceSimulationType::Baked, ReverbSimulationType::Realtime, nullptr, nullptr);
        REQUIRE(backend.last_baked_identifier.type == BakedDataType::StaticSource);
    }

    SECTION("Unchanged identifiers are sent once") {
        for (int i = 0; i < 5; ++i) {
            simulator.frame_update(false, SourceSimulationType::Realtime, ReverbSimulationType::Baked, nullptr, nullptr);
        }
        REQUIRE(backend.baked_identifier_updates == 1);
        REQUIRE(simulator.baked_identifier().type == BakedDataType::Reverb);
    }

    SECTION("Realtime reverb selects nothing") {
        simulator.frame_update(false, SourceSimulationType::Realtime, ReverbSimulationType::Realtime, nullptr, nullptr);
        REQUIRE(backend.baked_identifier_updates == 0);
    }
}

TEST_CASE_METHOD(SimulatorFixture, "IndirectSimulator flush and destroy", "[audio][simulator]") {
    lazy_init();
    REQUIRE(backend.live_effects() == 3);

    simulator.flush();
    REQUIRE(backend.effects_flushed == 3);

    simulator.destroy();
    REQUIRE(backend.live_effects() == 0);
    REQUIRE_FALSE(simulator.initialized());
    REQUIRE_FALSE(simulator.has_convolution_effect());

    std::vector<float> block(8, 1.0f);
    REQUIRE(process(block, 1.0f, false).empty());
    REQUIRE(backend.use_after_destroy == 0);

    SECTION("Destroy is idempotent") {
        simulator.destroy();
        REQUIRE(backend.effects_destroyed == 3);
    }
}
