/**
 * @file test_uniforms.cpp
 * @brief Unit tests for the uniform layout and host shadow block
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <flux/rules.h>
#include <flux/uniforms.h>
#include <cstring>

using namespace flux;
using Catch::Matchers::ContainsSubstring;

namespace {

UniformLayout makeLayout() {
    std::vector<UniformDecl> custom = {
        {"speed", 1.5f},
        {"tint", glm::vec3(1.0f, 0.5f, 0.0f)},
    };
    std::vector<UniformDecl> ruleParams = ruleUniforms({rules::Gravity{9.8f}, rules::Drag{0.5f}});
    auto layout = UniformLayout::build(custom, ruleParams);
    REQUIRE(layout.has_value());
    return *layout;
}

} // namespace

TEST_CASE("Uniform layout", "[uniforms]") {
    UniformLayout layout = makeLayout();

    SECTION("custom uniforms follow the 80 byte header") {
        REQUIRE(layout.find("speed")->offset == UniformLayout::HEADER_SIZE);
    }

    SECTION("vec3 uniforms align to 16") {
        REQUIRE(layout.find("tint")->offset == 96);
    }

    SECTION("rule parameters come after custom uniforms") {
        const UniformSlot* strength = layout.find("rule0_strength");
        const UniformSlot* coefficient = layout.find("rule1_coefficient");
        REQUIRE(strength != nullptr);
        REQUIRE(coefficient != nullptr);
        REQUIRE(strength->offset == 108);
        REQUIRE(coefficient->offset == 112);
    }

    SECTION("size is a multiple of 16") {
        REQUIRE(layout.size() % 16 == 0);
        REQUIRE(layout.size() == 128);
    }

    SECTION("WGSL struct starts with the header") {
        std::string wgsl = layout.toWgsl();
        REQUIRE_THAT(wgsl, ContainsSubstring("view_proj: mat4x4<f32>"));
        REQUIRE_THAT(wgsl, ContainsSubstring("particle_count: u32"));
        REQUIRE_THAT(wgsl, ContainsSubstring("tint: vec3<f32>"));
        REQUIRE_THAT(wgsl, ContainsSubstring("rule0_strength: f32"));
    }
}

TEST_CASE("Uniform layout errors", "[uniforms][errors]") {
    BuildError err;

    SECTION("duplicate names") {
        std::vector<UniformDecl> custom = {{"speed", 1.0f}, {"speed", 2.0f}};
        REQUIRE_FALSE(UniformLayout::build(custom, {}, &err).has_value());
        REQUIRE_THAT(err.message, ContainsSubstring("duplicate"));
    }

    SECTION("header names cannot be redeclared") {
        std::vector<UniformDecl> custom = {{"time", 1.0f}};
        REQUIRE_FALSE(UniformLayout::build(custom, {}, &err).has_value());
        REQUIRE(err.kind == ErrorKind::InvalidSchema);
    }
}

TEST_CASE("Uniform block writes", "[uniforms][block]") {
    UniformLayout layout = makeLayout();
    UniformBlock block(layout);

    SECTION("initial values are written") {
        REQUIRE(block.get("speed") == Value(1.5f));
        REQUIRE(block.get("rule0_strength") == Value(9.8f));
    }

    SECTION("a fresh block is fully dirty") {
        REQUIRE(block.hasDirtyRange());
        REQUIRE(block.dirtyBegin() == 0);
        REQUIRE(block.dirtyEnd() == layout.size());
    }

    SECTION("accepted writes extend the dirty range") {
        block.clearDirty();
        REQUIRE_FALSE(block.hasDirtyRange());

        REQUIRE(block.set("rule1_coefficient", 0.25f));
        REQUIRE(block.dirtyBegin() == 112);
        REQUIRE(block.dirtyEnd() == 116);

        REQUIRE(block.set("speed", 3.0f));
        REQUIRE(block.dirtyBegin() == 80);
        REQUIRE(block.dirtyEnd() == 116);
        REQUIRE(block.get("rule1_coefficient") == Value(0.25f));
    }

    SECTION("unknown name leaves the bytes untouched") {
        block.clearDirty();
        std::vector<uint8_t> before(block.data(), block.data() + block.size());
        REQUIRE_FALSE(block.set("rule9_strength", 1.0f));
        REQUIRE(block.lastError().kind == ErrorKind::UnknownParameter);
        REQUIRE_FALSE(block.hasDirtyRange());
        REQUIRE(std::memcmp(before.data(), block.data(), before.size()) == 0);
    }

    SECTION("mismatched type is rejected") {
        REQUIRE_FALSE(block.set("tint", 1.0f));
        REQUIRE(block.lastError().kind == ErrorKind::TypeMismatch);
        REQUIRE(block.get("tint") == Value(glm::vec3(1.0f, 0.5f, 0.0f)));
    }

    SECTION("header setters write at fixed offsets") {
        block.setTime(2.0f, 0.5f);
        block.setFrame(7);
        block.setParticleCount(1000);

        float time = 0.0f;
        float dt = 0.0f;
        uint32_t frame = 0;
        uint32_t count = 0;
        std::memcpy(&time, block.data() + UniformLayout::TIME_OFFSET, 4);
        std::memcpy(&dt, block.data() + UniformLayout::DELTA_TIME_OFFSET, 4);
        std::memcpy(&frame, block.data() + UniformLayout::FRAME_OFFSET, 4);
        std::memcpy(&count, block.data() + UniformLayout::PARTICLE_COUNT_OFFSET, 4);
        REQUIRE(time == 2.0f);
        REQUIRE(dt == 0.5f);
        REQUIRE(frame == 7);
        REQUIRE(count == 1000);
    }
}
