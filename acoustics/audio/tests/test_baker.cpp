#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <acoustics/audio/baker.hpp>
#include "fake_backend.hpp"
#include <chrono>
#include <string>
#include <thread>

using namespace acoustics::audio;
using namespace acoustics::audio::testing;
using namespace acoustics::core;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<ProbeRegion> two_regions() {
    return {
        ProbeRegion::from_box("lobby", Vec3{0.0f}, Vec3{10.0f}),
        ProbeRegion::from_box("hall", Vec3{20.0f, 0.0f, 0.0f}, Vec3{10.0f})
    };
}

void wait_until_progress(const Baker& baker) {
    for (int i = 0; i < 1000 && baker.progress() <= 0.0f; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

TEST_CASE("Baker rejects invalid requests", "[audio][baker]") {
    FakeBackend backend;
    Baker baker;

    SECTION("Missing environment") {
        auto result = baker.begin_bake(backend, EnvironmentHandle{}, BakingSettings{}, two_regions(),
            BakingMode::Reverb, kReverbIdentifier);
        REQUIRE(result.error == AudioError::SceneNotFound);
        REQUIRE(baker.status() == BakeStatus::Idle);
    }

    SECTION("No regions") {
        auto result = baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, {},
            BakingMode::Reverb, kReverbIdentifier);
        REQUIRE(result.error == AudioError::InvalidArgument);
        REQUIRE(backend.bake_calls == 0);
    }
}

TEST_CASE("Baker bakes every region", "[audio][baker]") {
    FakeBackend backend;
    Baker baker;

    auto started = baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
        BakingMode::Reverb, kReverbIdentifier);
    REQUIRE(started.ok());

    auto result = baker.end_bake();
    REQUIRE(result.ok());
    REQUIRE(baker.status() == BakeStatus::Complete);
    REQUIRE(baker.regions_baked() == 2);
    REQUIRE_THAT(baker.progress(), WithinAbs(1.0f, 0.0001f));
    REQUIRE(backend.baked_regions == std::vector<std::string>{"lobby", "hall"});

    SECTION("A finished bake can be restarted") {
        REQUIRE(baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
            BakingMode::Reverb, kReverbIdentifier).ok());
        REQUIRE(baker.end_bake().ok());
        REQUIRE(backend.bake_calls == 4);
    }
}

TEST_CASE("Baker cancellation", "[audio][baker]") {
    FakeBackend backend;
    backend.hold_bake = true;
    Baker baker;

    REQUIRE(baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
        BakingMode::Reverb, kReverbIdentifier).ok());
    REQUIRE(baker.is_baking());
    wait_until_progress(baker);

    SECTION("A second bake is refused while running") {
        auto second = baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
            BakingMode::Reverb, kReverbIdentifier);
        REQUIRE(second.error == AudioError::BakeInProgress);
    }

    REQUIRE_THAT(baker.progress(), WithinAbs(0.25f, 0.0001f));

    baker.cancel_bake();
    auto result = baker.end_bake();

    REQUIRE(result.error == AudioError::BakeCancelled);
    REQUIRE(baker.status() == BakeStatus::Cancelled);
    REQUIRE(baker.regions_baked() == 0);
    REQUIRE(backend.cancel_calls == 1);
}

TEST_CASE("Baker reports backend failures", "[audio][baker]") {
    FakeBackend backend;
    backend.bake_error = AudioError::BakeFailed;
    Baker baker;

    REQUIRE(baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
        BakingMode::Reverb, kReverbIdentifier).ok());
    auto result = baker.end_bake();

    REQUIRE(result.error == AudioError::BakeFailed);
    REQUIRE(result.message.find("lobby") != std::string::npos);
    REQUIRE(baker.status() == BakeStatus::Failed);
    REQUIRE(backend.bake_calls == 1);
}

TEST_CASE("Baker survives a throwing backend", "[audio][baker]") {
    FakeBackend backend;
    backend.throw_on_bake = true;
    Baker baker;

    REQUIRE(baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
        BakingMode::Reverb, kReverbIdentifier).ok());
    auto result = baker.end_bake();

    REQUIRE(result.error == AudioError::BakeFailed);
    REQUIRE(result.message.find("lobby") != std::string::npos);
    REQUIRE(baker.status() == BakeStatus::Failed);
    REQUIRE(baker.regions_baked() == 0);

    SECTION("The baker can run again afterwards") {
        backend.throw_on_bake = false;
        REQUIRE(baker.begin_bake(backend, EnvironmentHandle{1}, BakingSettings{}, two_regions(),
            BakingMode::Reverb, kReverbIdentifier).ok());
        REQUIRE(baker.end_bake().ok());
        REQUIRE(baker.status() == BakeStatus::Complete);
    }
}

TEST_CASE("BakeStatus names", "[audio][baker]") {
    REQUIRE(std::string(to_string(BakeStatus::Idle)) == "idle");
    REQUIRE(std::string(to_string(BakeStatus::Complete)) == "complete");
    REQUIRE(std::string(to_string(BakeStatus::Cancelled)) == "cancelled");
}
