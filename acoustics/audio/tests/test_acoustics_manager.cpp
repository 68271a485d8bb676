#include <catch2/catch_test_macros.hpp>
#include <acoustics/audio/acoustics_manager.hpp>
#include "fake_backend.hpp"

using namespace acoustics::audio;
using namespace acoustics::audio::testing;
using namespace acoustics::core;

namespace {

struct NullListener : IMixedAudioListener {
    bool accelerated_mixing_enabled() const noexcept override { return false; }
    void notify_mixed_audio() noexcept override {}
};

} // namespace

TEST_CASE("AcousticsManager settings accessors", "[audio][manager]") {
    FakeBackend backend;
    AcousticsSettings settings;
    settings.audio.channels = 6;
    settings.simulation.ambisonics_order = 2;
    AcousticsManager manager(backend, settings);

    REQUIRE_FALSE(manager.initialized());
    manager.initialize(false);
    manager.initialize(true);
    REQUIRE(manager.initialized());

    AudioFormat format = manager.audio_format();
    REQUIRE(format.channels == 6);
    REQUIRE(format.layout == ChannelLayout::FivePointOne);
    REQUIRE(manager.simulation_settings().ambisonics_order == 2);
    REQUIRE(&manager.backend() == &backend);
    REQUIRE(manager.container().ref_count() == 0);
}

TEST_CASE("AcousticsManager static listener", "[audio][manager]") {
    FakeBackend backend;
    AcousticsManager manager(backend, AcousticsSettings{});

    REQUIRE(manager.static_listener() == nullptr);

    manager.set_static_listener_node("balcony");
    REQUIRE(manager.static_listener() != nullptr);
    REQUIRE(manager.static_listener()->has_node());
    REQUIRE(manager.static_listener()->current_node == "balcony");

    manager.clear_static_listener();
    REQUIRE(manager.static_listener() == nullptr);
}

TEST_CASE("AcousticsManager active listener", "[audio][manager]") {
    FakeBackend backend;
    AcousticsManager manager(backend, AcousticsSettings{});
    NullListener first;
    NullListener second;

    manager.set_listener(&first);
    REQUIRE(manager.listener() == &first);

    SECTION("Clearing another listener keeps the active one") {
        manager.clear_listener(&second);
        REQUIRE(manager.listener() == &first);
    }

    SECTION("A second listener replaces the first with a warning") {
        CategoryCounter warnings("AcousticsManager", LogLevel::Warn);
        manager.set_listener(&second);
        REQUIRE(manager.listener() == &second);
        REQUIRE(warnings.count() == 1);
    }

    SECTION("Clearing the active listener") {
        manager.clear_listener(&first);
        REQUIRE(manager.listener() == nullptr);
    }
}

TEST_CASE("AcousticsManager probe regions", "[audio][manager]") {
    FakeBackend backend;
    AcousticsManager manager(backend, AcousticsSettings{});

    manager.add_probe_region(ProbeRegion::from_box("lobby", Vec3{0.0f}, Vec3{10.0f}));
    manager.add_probe_region(ProbeRegion::from_box("hall", Vec3{20.0f, 0.0f, 0.0f}, Vec3{8.0f}));
    REQUIRE(manager.probe_regions().size() == 2);

    SECTION("Same name replaces the region") {
        manager.add_probe_region(ProbeRegion::from_box("lobby", Vec3{0.0f}, Vec3{4.0f}));
        REQUIRE(manager.probe_regions().size() == 2);
        REQUIRE(manager.probe_regions()[0].bounds.size().x == 4.0f);
    }

    SECTION("Remove by name") {
        REQUIRE(manager.remove_probe_region("hall"));
        REQUIRE_FALSE(manager.remove_probe_region("hall"));
        REQUIRE(manager.probe_regions().size() == 1);
    }
}
