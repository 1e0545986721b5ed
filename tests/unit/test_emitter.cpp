/**
 * @file test_emitter.cpp
 * @brief Unit tests for emitters, emission scheduling and sub-emitter settings
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <flux/emitter.h>

using namespace flux;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Emitter basics", "[emitter]") {
    SECTION("kind names") {
        REQUIRE(std::string(emitterKindName(emitters::Point{})) == "Point");
        REQUIRE(std::string(emitterKindName(emitters::Burst{})) == "Burst");
        REQUIRE(std::string(emitterKindName(emitters::Box{})) == "Box");
    }

    SECTION("rate of continuous and burst emitters") {
        emitters::Cone cone;
        cone.rate = 250.0f;
        REQUIRE(Emitter(cone).rate() == 250.0f);

        emitters::Burst burst;
        burst.count = 40;
        Emitter e(burst);
        REQUIRE(e.isBurst());
        REQUIRE(e.rate() == 40.0f);
    }

    SECTION("type and color overrides") {
        Emitter e = Emitter(emitters::Point{}).withType(2).withColor(glm::vec3(1.0f, 0.0f, 0.0f));
        REQUIRE(e.particleType == 2u);
        REQUIRE(e.color.has_value());
    }
}

TEST_CASE("Emitter validation", "[emitter][errors]") {
    emitters::Point negative;
    negative.rate = -1.0f;
    auto err = validateEmitter(negative);
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ErrorKind::InvalidEmitter);
    REQUIRE_THAT(err->message, ContainsSubstring("Point"));

    emitters::Box box;
    box.min = glm::vec3(1.0f);
    box.max = glm::vec3(0.0f);
    REQUIRE(validateEmitter(box).has_value());

    emitters::Sphere sphere;
    sphere.radius = -0.5f;
    REQUIRE(validateEmitter(sphere).has_value());

    REQUIRE_FALSE(validateEmitter(emitters::Cone{}).has_value());
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_CASE("Emission scheduler", "[emitter][schedule]") {
    SECTION("continuous rate stays within 5% over one second") {
        emitters::Point point;
        point.rate = 500.0f;
        EmissionScheduler scheduler({point});

        uint64_t total = 0;
        for (int frame = 0; frame < 60; ++frame) {
            total += scheduler.advance(1.0f / 60.0f)[0];
        }
        REQUIRE(total >= 475);
        REQUIRE(total <= 525);
        REQUIRE(scheduler.totalScheduled() == total);
    }

    SECTION("fractions carry to later frames") {
        emitters::Point point;
        point.rate = 30.0f;
        EmissionScheduler scheduler({point});

        REQUIRE(scheduler.advance(1.0f / 60.0f)[0] == 0);
        REQUIRE(scheduler.advance(1.0f / 60.0f)[0] == 1);
    }

    SECTION("bursts fire once, then again after a trigger") {
        emitters::Burst burst;
        burst.count = 100;
        EmissionScheduler scheduler({burst});

        REQUIRE(scheduler.advance(0.016f)[0] == 100);
        REQUIRE(scheduler.advance(0.016f)[0] == 0);
        REQUIRE(scheduler.advance(0.016f)[0] == 0);

        scheduler.triggerBurst();
        REQUIRE(scheduler.advance(0.016f)[0] == 100);
        REQUIRE(scheduler.totalScheduled() == 200);
    }

    SECTION("triggering a single emitter") {
        emitters::Point point;
        emitters::Burst burst;
        burst.count = 10;
        EmissionScheduler scheduler({point, burst});
        scheduler.advance(0.0f);

        REQUIRE_FALSE(scheduler.triggerBurst(0));
        REQUIRE_FALSE(scheduler.triggerBurst(5));
        REQUIRE(scheduler.triggerBurst(1));
        REQUIRE(scheduler.advance(0.0f)[1] == 10);
    }

    SECTION("rate changes apply to continuous emitters only") {
        emitters::Point point;
        point.rate = 0.0f;
        emitters::Burst burst;
        EmissionScheduler scheduler({point, burst});

        REQUIRE(scheduler.advance(1.0f)[0] == 0);
        REQUIRE(scheduler.setRate(0, 120.0f));
        REQUIRE(scheduler.advance(0.5f)[0] == 60);
        REQUIRE_FALSE(scheduler.setRate(1, 5.0f));
        REQUIRE_FALSE(scheduler.setRate(0, -5.0f));
    }

    SECTION("state carries over to a rebuilt scheduler") {
        emitters::Point point;
        point.rate = 30.0f;
        emitters::Burst burst;
        EmissionScheduler first({point, burst});
        first.advance(1.0f / 60.0f);

        EmissionScheduler second({point, burst});
        second.adoptState(first);
        const auto& budgets = second.advance(1.0f / 60.0f);
        REQUIRE(budgets[0] == 1);
        REQUIRE(budgets[1] == 0);
        REQUIRE(second.totalScheduled() == first.totalScheduled() + 1);
    }
}

TEST_CASE("Emitter GPU packing", "[emitter][gpu-data]") {
    emitters::Cone cone;
    cone.position = glm::vec3(1.0f, 2.0f, 3.0f);
    cone.speed = 4.0f;
    cone.spread = 0.25f;
    EmitterGpuData d = packEmitter(Emitter(cone).withType(3), 17);

    REQUIRE(d.kind == 2);
    REQUIRE(d.budget == 17);
    REQUIRE(d.a == glm::vec4(1.0f, 2.0f, 3.0f, 4.0f));
    REQUIRE(d.b.w == 0.25f);
    REQUIRE(d.hasType == 1);
    REQUIRE(d.particleType == 3);
    REQUIRE(d.color.w == 0.0f);
}

TEST_CASE("Sub-emitter validation", "[emitter][sub]") {
    SubEmitter sub;
    REQUIRE_FALSE(validateSubEmitter(sub).has_value());

    sub.speedMin = 2.0f;
    sub.speedMax = 1.0f;
    REQUIRE(validateSubEmitter(sub).has_value());
}
