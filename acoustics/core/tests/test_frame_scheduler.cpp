#include <catch2/catch_test_macros.hpp>
#include <acoustics/core/frame_scheduler.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace acoustics::core;

TEST_CASE("FrameScheduler runs phases in order", "[core][scheduler]") {
    FrameScheduler scheduler;
    std::vector<std::string> order;

    scheduler.add(Phase::EndOfFrame, [&](double) { order.push_back("end"); });
    scheduler.add(Phase::PreUpdate, [&](double) { order.push_back("pre"); });
    scheduler.add(Phase::PostUpdate, [&](double) { order.push_back("post"); });
    scheduler.add(Phase::Update, [&](double) { order.push_back("update"); });

    scheduler.tick(0.016);

    REQUIRE(order == std::vector<std::string>{"pre", "update", "post", "end"});
    REQUIRE(scheduler.frame_count() == 1);
}

TEST_CASE("FrameScheduler priorities", "[core][scheduler]") {
    FrameScheduler scheduler;
    std::vector<int> order;

    scheduler.add(Phase::Update, [&](double) { order.push_back(0); }, "low", 0);
    scheduler.add(Phase::Update, [&](double) { order.push_back(10); }, "high", 10);
    scheduler.add(Phase::Update, [&](double) { order.push_back(5); }, "mid", 5);
    scheduler.add(Phase::Update, [&](double) { order.push_back(1); }, "low2", 0);

    scheduler.run(0.0, Phase::Update);

    SECTION("Higher priority runs first, ties keep insertion order") {
        REQUIRE(order == std::vector<int>{10, 5, 0, 1});
    }
}

TEST_CASE("FrameScheduler named tasks", "[core][scheduler]") {
    FrameScheduler scheduler;
    int calls = 0;
    double last_dt = 0.0;

    scheduler.add(Phase::EndOfFrame, [&](double dt) { ++calls; last_dt = dt; }, "task");
    REQUIRE(scheduler.contains("task"));
    REQUIRE(scheduler.is_enabled("task"));

    SECTION("Delta time is forwarded") {
        scheduler.tick(0.25);
        REQUIRE(calls == 1);
        REQUIRE(last_dt == 0.25);
    }

    SECTION("Disabled tasks are skipped") {
        scheduler.set_enabled("task", false);
        REQUIRE_FALSE(scheduler.is_enabled("task"));
        scheduler.tick(0.016);
        REQUIRE(calls == 0);

        scheduler.set_enabled("task", true);
        scheduler.tick(0.016);
        REQUIRE(calls == 1);
    }

    SECTION("Removed tasks stop running") {
        scheduler.remove("task");
        REQUIRE_FALSE(scheduler.contains("task"));
        scheduler.tick(0.016);
        REQUIRE(calls == 0);
    }

    SECTION("Unknown names are harmless") {
        scheduler.remove("missing");
        scheduler.set_enabled("missing", false);
        REQUIRE_FALSE(scheduler.is_enabled("missing"));
        REQUIRE_FALSE(scheduler.contains(""));
    }

    SECTION("Clear drops everything") {
        scheduler.clear();
        REQUIRE_FALSE(scheduler.contains("task"));
    }
}

TEST_CASE("FrameScheduler task may remove itself", "[core][scheduler]") {
    FrameScheduler scheduler;
    int calls = 0;

    scheduler.add(Phase::EndOfFrame, [&](double) {
        ++calls;
        scheduler.remove("self");
    }, "self");

    scheduler.tick(0.016);
    scheduler.tick(0.016);

    REQUIRE(calls == 1);
    REQUIRE(scheduler.frame_count() == 2);
}

TEST_CASE("FrameScheduler ignores empty tasks", "[core][scheduler]") {
    FrameScheduler scheduler;
    scheduler.add(Phase::Update, FrameTask{}, "empty");
    REQUIRE_FALSE(scheduler.contains("empty"));
    scheduler.tick(0.016);
}

TEST_CASE("FrameScheduler removal during a run", "[core][scheduler]") {
    FrameScheduler scheduler;
    auto listener_calls = std::make_unique<int>(0);
    int* observed = listener_calls.get();
    int runs_after_free = 0;

    // The host tears down a lower priority task and frees what it captured
    scheduler.add(Phase::EndOfFrame, [&](double) {
        if (!listener_calls) return;
        scheduler.remove("listener");
        listener_calls.reset();
    }, "host", 10);
    scheduler.add(Phase::EndOfFrame, [&](double) {
        if (!listener_calls) {
            ++runs_after_free;
            return;
        }
        ++*listener_calls;
    }, "listener", 0);

    SECTION("Removed task does not run later in the same phase") {
        scheduler.tick(0.016);
        REQUIRE(runs_after_free == 0);
        REQUIRE_FALSE(scheduler.contains("listener"));

        scheduler.tick(0.016);
        REQUIRE(runs_after_free == 0);
    }

    SECTION("Clear stops the rest of the phase") {
        scheduler.add(Phase::EndOfFrame, [&](double) { scheduler.clear(); }, "clear", 20);
        scheduler.tick(0.016);
        REQUIRE(runs_after_free == 0);
        REQUIRE(*observed == 0);
        REQUIRE_FALSE(scheduler.contains("host"));
    }
}

TEST_CASE("FrameScheduler tasks added during a run start next time", "[core][scheduler]") {
    FrameScheduler scheduler;
    int added_calls = 0;
    bool added = false;

    scheduler.add(Phase::Update, [&](double) {
        if (added) return;
        added = true;
        scheduler.add(Phase::Update, [&](double) { ++added_calls; }, "late", 100);
        REQUIRE(scheduler.contains("late"));
    }, "spawner");

    scheduler.tick(0.016);
    REQUIRE(added_calls == 0);

    scheduler.tick(0.016);
    REQUIRE(added_calls == 1);
}
