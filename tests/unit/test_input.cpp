/**
 * @file test_input.cpp
 * @brief Unit tests for per-frame input snapshots
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flux/input.h>

using namespace flux;
using Catch::Matchers::WithinAbs;

namespace {
constexpr int KEY_SPACE = 32;
constexpr int KEY_A = 65;
}

TEST_CASE("Key latches", "[input][keys]") {
    InputTracker tracker;
    Camera camera;

    SECTION("press reads as pressed and held for one frame") {
        tracker.keyEvent(KEY_SPACE, true);
        InputSnapshot snap = tracker.snapshot(camera);
        REQUIRE(snap.keyPressed(KEY_SPACE));
        REQUIRE(snap.keyHeld(KEY_SPACE));

        tracker.endFrame();
        snap = tracker.snapshot(camera);
        REQUIRE_FALSE(snap.keyPressed(KEY_SPACE));
        REQUIRE(snap.keyHeld(KEY_SPACE));
    }

    SECTION("a tap between snapshots is not lost") {
        tracker.keyEvent(KEY_A, true);
        tracker.keyEvent(KEY_A, false);
        InputSnapshot snap = tracker.snapshot(camera);
        REQUIRE(snap.keyPressed(KEY_A));
        REQUIRE(snap.key(KEY_A).released);
        REQUIRE_FALSE(snap.keyHeld(KEY_A));
    }

    SECTION("key repeat does not re-latch") {
        tracker.keyEvent(KEY_A, true);
        tracker.endFrame();
        tracker.keyEvent(KEY_A, true);
        REQUIRE_FALSE(tracker.snapshot(camera).keyPressed(KEY_A));
    }

    SECTION("out of range codes are ignored") {
        tracker.keyEvent(-1, true);
        tracker.keyEvent(MAX_KEYS + 5, true);
        InputSnapshot snap = tracker.snapshot(camera);
        REQUIRE_FALSE(snap.keyHeld(-1));
        REQUIRE_FALSE(snap.keyHeld(MAX_KEYS + 5));
    }

    SECTION("mouse buttons latch like keys") {
        tracker.mouseButtonEvent(0, true);
        REQUIRE(tracker.snapshot(camera).mouseButton(0).pressed);
        tracker.endFrame();
        tracker.mouseButtonEvent(0, false);
        REQUIRE(tracker.snapshot(camera).mouseButton(0).released);
    }
}

TEST_CASE("Mouse position", "[input][mouse]") {
    InputTracker tracker;
    Camera camera;
    camera.orbit(3.0f, 0.0f, 0.0f);
    tracker.setViewport(800.0f, 600.0f);

    SECTION("pixels map to NDC with +y up") {
        tracker.mouseMove(0.0f, 0.0f);
        InputSnapshot snap = tracker.snapshot(camera);
        REQUIRE(snap.mouseNdc() == glm::vec2(-1.0f, 1.0f));

        tracker.mouseMove(800.0f, 600.0f);
        REQUIRE(tracker.snapshot(camera).mouseNdc() == glm::vec2(1.0f, -1.0f));
    }

    SECTION("screen center projects to the world origin") {
        tracker.mouseMove(400.0f, 300.0f);
        auto world = tracker.snapshot(camera).mouseWorld();
        REQUIRE(world.has_value());
        REQUIRE_THAT(world->x, WithinAbs(0.0, 1e-4));
        REQUIRE_THAT(world->y, WithinAbs(0.0, 1e-4));
        REQUIRE_THAT(world->z, WithinAbs(0.0, 1e-4));
    }

    SECTION("scroll accumulates until the frame ends") {
        tracker.scrollEvent(0.0f, 1.0f);
        tracker.scrollEvent(0.0f, 2.0f);
        REQUIRE(tracker.snapshot(camera).scroll().y == 3.0f);
        tracker.endFrame();
        REQUIRE(tracker.snapshot(camera).scroll().y == 0.0f);
    }
}
