/**
 * @file test_lifecycle.cpp
 * @brief Unit tests for lifecycle settings and presets
 */

#include <catch2/catch_test_macros.hpp>
#include <flux/lifecycle.h>

using namespace flux;

TEST_CASE("Lifecycle rule expansion", "[lifecycle]") {
    SECTION("empty lifecycle adds nothing") {
        Lifecycle l;
        REQUIRE(l.rules().empty());
        REQUIRE_FALSE(l.needsColor());
    }

    SECTION("fade without a lifetime only ages") {
        Lifecycle l;
        l.fadeOut();
        auto rules = l.rules();
        REQUIRE(rules.size() == 1);
        REQUIRE(rules[0].is<rules::Age>());
    }

    SECTION("full lifecycle order") {
        Lifecycle l;
        l.lifetime(2.0f).fadeOut().shrinkOut().colorOverLife(glm::vec3(1.0f), glm::vec3(0.0f));
        auto rules = l.rules();
        REQUIRE(rules.size() == 5);
        REQUIRE(rules[0].is<rules::Age>());
        REQUIRE(rules[1].is<rules::Lifetime>());
        REQUIRE(rules[2].is<rules::ColorOverLife>());
        REQUIRE(rules[3].is<rules::FadeOut>());
        REQUIRE(rules[4].is<rules::ShrinkOut>());
        REQUIRE(rules[1].as<rules::Lifetime>().duration == 2.0f);
        REQUIRE(rules[4].as<rules::ShrinkOut>().duration == 2.0f);
        REQUIRE(l.needsColor());
    }

    SECTION("shrink alone needs no color") {
        Lifecycle l;
        l.lifetime(1.0f).shrinkOut();
        REQUIRE_FALSE(l.needsColor());
    }
}

TEST_CASE("Lifecycle presets", "[lifecycle][presets]") {
    SECTION("every preset starts dead with one emitter") {
        for (LifecyclePreset p : {LifecyclePreset::Fire, LifecyclePreset::Fountain,
                                  LifecyclePreset::Explosion, LifecyclePreset::Smoke,
                                  LifecyclePreset::Sparkler, LifecyclePreset::Rain}) {
            Lifecycle l = Lifecycle::preset(p, glm::vec3(0.0f), 200.0f);
            INFO(lifecyclePresetName(p));
            REQUIRE(l.startsDead());
            REQUIRE(l.emitters().size() == 1);
            REQUIRE(l.lifetime().has_value());
        }
    }

    SECTION("fire emits upward at the given rate") {
        Lifecycle l = Lifecycle::fire(glm::vec3(0.0f, -0.5f, 0.0f), 800.0f);
        const Emitter& e = l.emitters()[0];
        REQUIRE(std::string(emitterKindName(e)) == "Cone");
        REQUIRE(e.rate() == 800.0f);
        REQUIRE(std::get<emitters::Cone>(e.shape).direction.y == 1.0f);
    }

    SECTION("explosion is a single burst of the requested count") {
        Lifecycle l = Lifecycle::preset(LifecyclePreset::Explosion, glm::vec3(0.0f), 500.0f);
        const Emitter& e = l.emitters()[0];
        REQUIRE(e.isBurst());
        REQUIRE(std::get<emitters::Burst>(e.shape).count == 500);
    }

    SECTION("none is empty") {
        Lifecycle l = Lifecycle::preset(LifecyclePreset::None, glm::vec3(0.0f), 100.0f);
        REQUIRE(l.emitters().empty());
        REQUIRE(l.rules().empty());
    }

    SECTION("names round trip") {
        REQUIRE(parseLifecyclePreset("sparkler") == LifecyclePreset::Sparkler);
        REQUIRE(std::string(lifecyclePresetName(LifecyclePreset::Rain)) == "rain");
        REQUIRE_FALSE(parseLifecyclePreset("volcano").has_value());
    }
}
