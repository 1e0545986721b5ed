/**
 * @file test_field.cpp
 * @brief Unit tests for the field registry and the host field model
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <flux/field.h>
#include <cmath>

using namespace flux;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Registry
// =============================================================================

TEST_CASE("Field registry", "[field][registry]") {
    FieldConfig scalar;
    scalar.name = "density";
    scalar.resolution = 16;

    FieldConfig vector;
    vector.name = "flow";
    vector.kind = FieldKind::Vector;
    vector.resolution = 8;

    SECTION("ids and bases follow declaration order") {
        auto reg = FieldRegistry::build({scalar, vector});
        REQUIRE(reg.has_value());
        REQUIRE(reg->size() == 2);
        REQUIRE(reg->idOf("density") == 0u);
        REQUIRE(reg->idOf("flow") == 1u);
        REQUIRE(reg->baseOf(0) == 0);
        REQUIRE(reg->baseOf(1) == 16 * 16 * 16);
        REQUIRE(reg->totalElements() == 16 * 16 * 16 + 8 * 8 * 8 * 4);
        REQUIRE_FALSE(reg->idOf("missing").has_value());
    }

    SECTION("params mirror the configs") {
        auto reg = FieldRegistry::build({scalar, vector});
        REQUIRE(reg.has_value());
        auto params = reg->params();
        REQUIRE(params.size() == 2);
        REQUIRE(params[1].components == 4);
        REQUIRE(params[1].base == 4096);
        REQUIRE(params[0].resolution == 16);
    }

    SECTION("decay and blur are clamped") {
        scalar.decay = 1.5f;
        scalar.blur = -0.2f;
        auto reg = FieldRegistry::build({scalar});
        REQUIRE(reg.has_value());
        REQUIRE(reg->field(0).decay == 1.0f);
        REQUIRE(reg->field(0).blur == 0.0f);
    }

    SECTION("empty registry still has backing elements") {
        auto reg = FieldRegistry::build({});
        REQUIRE(reg.has_value());
        REQUIRE(reg->empty());
        REQUIRE(reg->totalElements() == 4);
    }

    SECTION("errors") {
        BuildError err;

        FieldConfig bad = scalar;
        bad.resolution = 4;
        REQUIRE_FALSE(FieldRegistry::build({bad}, &err).has_value());
        REQUIRE(err.kind == ErrorKind::InvalidField);

        REQUIRE_FALSE(FieldRegistry::build({scalar, scalar}, &err).has_value());
        REQUIRE_THAT(err.message, ContainsSubstring("duplicate"));

        bad = scalar;
        bad.name = "has space";
        REQUIRE_FALSE(FieldRegistry::build({bad}, &err).has_value());

        bad = scalar;
        bad.extent = 0.0f;
        REQUIRE_FALSE(FieldRegistry::build({bad}, &err).has_value());

        std::vector<FieldConfig> many;
        for (uint32_t i = 0; i <= MAX_FIELDS; ++i) {
            FieldConfig f = scalar;
            f.name = "f" + std::to_string(i);
            f.resolution = 8;
            many.push_back(f);
        }
        REQUIRE_FALSE(FieldRegistry::build(many, &err).has_value());
    }
}

TEST_CASE("Blur pass count", "[field]") {
    FieldConfig f;
    f.blur = 0.0f;
    REQUIRE(blurPassCount(f) == 0);
    f.blur = 0.2f;
    f.blurIterations = 2;
    REQUIRE(blurPassCount(f) == 6);
}

// =============================================================================
// Host Model
// =============================================================================

TEST_CASE("Field volume", "[field][volume]") {
    FieldConfig config;
    config.name = "signal";
    config.resolution = 33;
    config.extent = 1.0f;
    config.decay = 0.9f;
    config.blur = 0.0f;

    SECTION("odd resolution centers a voxel on the origin") {
        FieldVolume volume(config);
        glm::vec3 g = volume.gridPosition(glm::vec3(0.0f));
        REQUIRE_THAT(g.x, WithinAbs(16.0, 1e-5));
        REQUIRE_THAT(g.y, WithinAbs(16.0, 1e-5));
    }

    SECTION("single deposit decays geometrically") {
        FieldVolume volume(config);
        volume.deposit(glm::vec3(0.0f), glm::vec4(1.0f));
        for (int frame = 1; frame <= 10; ++frame) {
            volume.step();
            REQUIRE_THAT(volume.voxel(16, 16, 16), WithinRel(std::pow(0.9, frame), 1e-4));
        }
        REQUIRE(volume.voxel(17, 16, 16) == 0.0f);
    }

    SECTION("off-center deposit splits trilinearly") {
        config.decay = 1.0f;
        FieldVolume volume(config);
        float halfVoxel = 1.0f / 33.0f;
        volume.deposit(glm::vec3(halfVoxel, 0.0f, 0.0f), glm::vec4(1.0f));
        volume.step();
        REQUIRE_THAT(volume.voxel(16, 16, 16), WithinRel(0.5f, 1e-3f));
        REQUIRE_THAT(volume.voxel(17, 16, 16), WithinRel(0.5f, 1e-3f));
    }

    SECTION("blur spreads to neighbors and keeps interior mass") {
        config.decay = 1.0f;
        config.blur = 0.5f;
        FieldVolume volume(config);
        volume.deposit(glm::vec3(0.0f), glm::vec4(1.0f));
        volume.step();

        float center = volume.voxel(16, 16, 16);
        REQUIRE(center < 1.0f);
        REQUIRE(volume.voxel(15, 16, 16) > 0.0f);
        REQUIRE(volume.voxel(16, 17, 16) > 0.0f);
        REQUIRE(volume.voxel(16, 16, 15) > 0.0f);

        double total = 0.0;
        for (float v : volume.data()) total += v;
        REQUIRE_THAT(total, WithinRel(1.0, 1e-4));
    }

    SECTION("sampling interpolates between voxels") {
        config.decay = 1.0f;
        FieldVolume volume(config);
        volume.deposit(glm::vec3(0.0f), glm::vec4(1.0f));
        volume.step();
        REQUIRE_THAT(volume.sample(glm::vec3(0.0f)).x, WithinRel(1.0f, 1e-4f));
        float halfVoxel = 1.0f / 33.0f;
        REQUIRE_THAT(volume.sample(glm::vec3(halfVoxel, 0.0f, 0.0f)).x, WithinRel(0.5f, 1e-3f));
    }

    SECTION("vector fields keep four components") {
        config.kind = FieldKind::Vector;
        config.decay = 1.0f;
        FieldVolume volume(config);
        volume.deposit(glm::vec3(0.0f), glm::vec4(1.0f, -2.0f, 0.5f, 0.0f));
        volume.step();
        REQUIRE_THAT(volume.voxel(16, 16, 16, 1), WithinRel(-2.0f, 1e-4f));
        REQUIRE_THAT(volume.voxel(16, 16, 16, 2), WithinRel(0.5f, 1e-4f));
    }
}

TEST_CASE("Field engine program", "[field][wgsl]") {
    std::string wgsl = fieldEngineProgram();
    REQUIRE_THAT(wgsl, ContainsSubstring("fn merge_decay("));
    REQUIRE_THAT(wgsl, ContainsSubstring("fn blur_ab("));
    REQUIRE_THAT(wgsl, ContainsSubstring("fn blur_ba("));
}
