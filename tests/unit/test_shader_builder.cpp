/**
 * @file test_shader_builder.cpp
 * @brief Unit tests for WGSL program synthesis
 *
 * Covers bind group planning, neighbor loop merging, optional bindings and
 * full builder compilation without a device.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <flux/shader_builder.h>
#include <flux/simulation.h>

using namespace flux;
using Catch::Matchers::ContainsSubstring;

namespace {

size_t countOf(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

struct Fixture {
    ParticleLayout layout;
    UniformLayout uniforms;
    FieldRegistry fields;

    Fixture(const std::vector<Rule>& rules, const std::vector<FieldConfig>& fieldList = {},
            const ParticleSchema& schema = ParticleSchema::basic())
        : layout(*ParticleLayout::build(schema))
        , uniforms(*UniformLayout::build({}, ruleUniforms(rules)))
        , fields(*FieldRegistry::build(fieldList)) {}
};

ShaderConfig configFor(const std::vector<Rule>& rules) {
    ShaderConfig config;
    config.bounds = 1.0f;
    config.spatial.cellSize = 0.1f;
    config.rules = rules;
    return config;
}

} // namespace

// =============================================================================
// Bind Group Planning
// =============================================================================

TEST_CASE("Bind group plan", "[shader][bindings]") {
    SECTION("force-only simulation has a single group") {
        std::vector<Rule> rules = {rules::Gravity{}, rules::BounceWalls{}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));

        BindGroupPlan plan = builder.bindGroups();
        REQUIRE(plan.count == 1);
        REQUIRE_FALSE(plan.grid.has_value());
        REQUIRE_FALSE(plan.fields.has_value());
        REQUIRE_FALSE(plan.death.has_value());
    }

    SECTION("groups are numbered contiguously") {
        std::vector<Rule> rules = {rules::Separate{}};
        Fixture f(rules, {FieldConfig{"trail"}});
        ShaderConfig config = configFor(rules);
        config.subEmitters.push_back(SubEmitter{});
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);

        BindGroupPlan plan = builder.bindGroups();
        REQUIRE(plan.grid == 1u);
        REQUIRE(plan.fields == 2u);
        REQUIRE(plan.death == 3u);
        REQUIRE(plan.count == 4);
    }

    SECTION("fields without neighbors take group 1") {
        std::vector<Rule> rules = {rules::Drag{}};
        Fixture f(rules, {FieldConfig{"trail"}});
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        REQUIRE(builder.bindGroups().fields == 1u);
    }
}

// =============================================================================
// Simulate Program
// =============================================================================

TEST_CASE("Simulate program", "[shader][simulate]") {
    SECTION("no grid bindings without neighbor rules") {
        std::vector<Rule> rules = {rules::Gravity{}, rules::Drag{}, rules::BounceWalls{}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.simulateProgram();

        REQUIRE_THAT(wgsl, ContainsSubstring("fn simulate("));
        REQUIRE_THAT(wgsl, ContainsSubstring("@workgroup_size(64)"));
        REQUIRE(wgsl.find("sorted_indices") == std::string::npos);
        REQUIRE(wgsl.find("cell_offsets") == std::string::npos);
        REQUIRE(wgsl.find("field_deposit") == std::string::npos);
    }

    SECTION("rules appear in list order") {
        std::vector<Rule> rules = {rules::Drag{}, rules::Gravity{}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.simulateProgram();
        REQUIRE(wgsl.find("// Drag") < wgsl.find("// Gravity"));
    }

    SECTION("contiguous neighbor rules share one loop") {
        std::vector<Rule> rules = {rules::Separate{}, rules::Cohere{0.1f, 1.0f}, rules::Align{}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.simulateProgram();

        REQUIRE_THAT(wgsl, ContainsSubstring("sorted_indices"));
        REQUIRE(countOf(wgsl, "let nl_center") == 1);
    }

    SECTION("a force rule between neighbor rules splits the loop") {
        std::vector<Rule> rules = {rules::Separate{}, rules::Gravity{}, rules::Cohere{0.1f, 1.0f}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        REQUIRE(countOf(builder.simulateProgram(), "let nl_center") == 2);
    }

    SECTION("max neighbors caps the loop") {
        std::vector<Rule> rules = {rules::Separate{}};
        Fixture f(rules);
        ShaderConfig config = configFor(rules);
        config.spatial.maxNeighbors = 16;
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);
        REQUIRE_THAT(builder.simulateProgram(), ContainsSubstring("nl_count >= 16u"));
    }

    SECTION("fields declare their id constants") {
        std::vector<Rule> rules = {rules::Drag{}};
        Fixture f(rules, {FieldConfig{"trail"}});
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.simulateProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("FIELD_TRAIL"));
        REQUIRE_THAT(wgsl, ContainsSubstring("field_deposit"));
    }

    SECTION("sub-emitters record deaths of the parent type") {
        std::vector<Rule> rules = {rules::Lifetime{1.0f}};
        Fixture f(rules);
        ShaderConfig config = configFor(rules);
        SubEmitter sub;
        sub.parentType = 2;
        config.subEmitters.push_back(sub);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);
        std::string wgsl = builder.simulateProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("atomicAdd(&death.count, 1u)"));
        REQUIRE_THAT(wgsl, ContainsSubstring("p.particle_type == 2u"));
    }

    SECTION("compute prelude is spliced at module scope") {
        std::vector<Rule> rules = {rules::Custom{"p.velocity += wind() * dt;"}};
        Fixture f(rules);
        ShaderConfig config = configFor(rules);
        config.custom.computePrelude = "fn wind() -> vec3<f32> { return vec3<f32>(1.0, 0.0, 0.0); }";
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);
        std::string wgsl = builder.simulateProgram();
        REQUIRE(wgsl.find("fn wind()") < wgsl.find("fn simulate("));
    }
}

TEST_CASE("Shader builder validation", "[shader][errors]") {
    SECTION("cell size smaller than a neighbor radius") {
        std::vector<Rule> rules = {rules::Cohere{0.3f, 1.0f}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        auto err = builder.validate();
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::CellSizeTooSmall);
    }

    SECTION("rule errors name the rule index") {
        std::vector<Rule> rules = {rules::Gravity{}, rules::SpeedLimit{3.0f, 1.0f}};
        Fixture f(rules);
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        auto err = builder.validate();
        REQUIRE(err.has_value());
        REQUIRE_THAT(err->message, ContainsSubstring("rule 1"));
    }
}

// =============================================================================
// Other Programs
// =============================================================================

TEST_CASE("Render, emit and sub-emit programs", "[shader][render]") {
    std::vector<Rule> rules = {rules::Gravity{}};
    ParticleSchema schema = ParticleSchema::basic();
    schema.color();
    Fixture f(rules, {}, schema);

    SECTION("render program has both stages") {
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.renderProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("fn vs_main("));
        REQUIRE_THAT(wgsl, ContainsSubstring("fn fs_main("));
    }

    SECTION("custom vertex and fragment code is spliced") {
        ShaderConfig config = configFor(rules);
        config.custom.vertex = "out.color.r = 1.0;";
        config.custom.fragment = "color.a = 0.5;";
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);
        std::string wgsl = builder.renderProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("out.color.r = 1.0;"));
        REQUIRE_THAT(wgsl, ContainsSubstring("color.a = 0.5;"));
    }

    SECTION("emit program writes the color field") {
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, configFor(rules));
        std::string wgsl = builder.emitProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("fn emit("));
        REQUIRE_THAT(wgsl, ContainsSubstring("q.color = em.color.xyz;"));
    }

    SECTION("sub-emit program reads death events") {
        ShaderConfig config = configFor(rules);
        config.subEmitters.push_back(SubEmitter{});
        ShaderBuilder builder(f.layout, f.uniforms, f.fields, config);
        std::string wgsl = builder.subEmitProgram();
        REQUIRE_THAT(wgsl, ContainsSubstring("fn sub_emit("));
        REQUIRE_THAT(wgsl, ContainsSubstring("DeathBuffer"));
    }
}

// =============================================================================
// Builder Compilation
// =============================================================================

TEST_CASE("SimulationBuilder compile", "[shader][builder]") {
    BuildError err;

    SECTION("defaults compile") {
        auto programs = SimulationBuilder().particleCount(100).rule(rules::Gravity{}).compile(&err);
        REQUIRE(programs.has_value());
        REQUIRE_FALSE(programs->needsNeighbors);
        REQUIRE(programs->emit.empty());
        REQUIRE(programs->subEmit.empty());
        REQUIRE(programs->layout.stride() == 48);
    }

    SECTION("zero particles is a config error") {
        REQUIRE_FALSE(SimulationBuilder().particleCount(0).compile(&err).has_value());
        REQUIRE(err.kind == ErrorKind::InvalidConfig);
    }

    SECTION("unsupported schema type") {
        ParticleSchema schema = ParticleSchema::basic();
        schema.field("weight", "f64");
        REQUIRE_FALSE(SimulationBuilder().schema(schema).compile(&err).has_value());
        REQUIRE(err.kind == ErrorKind::UnsupportedFieldType);
    }

    SECTION("neighbor radius beyond the cell size") {
        auto programs = SimulationBuilder()
            .spatial(0.05f)
            .rule(rules::Separate{0.1f, 1.0f})
            .compile(&err);
        REQUIRE_FALSE(programs.has_value());
        REQUIRE(err.kind == ErrorKind::CellSizeTooSmall);
    }

    SECTION("too many grid cells per axis") {
        auto programs = SimulationBuilder()
            .bounds(20.0f)
            .spatial(0.1f)
            .rule(rules::Separate{0.05f, 1.0f})
            .compile(&err);
        REQUIRE_FALSE(programs.has_value());
        REQUIRE(err.kind == ErrorKind::InvalidConfig);
    }

    SECTION("lifecycle adds a color field and its rules") {
        auto programs = SimulationBuilder()
            .rule(rules::Gravity{})
            .lifecycle(Lifecycle::fire(glm::vec3(0.0f), 100.0f))
            .compile(&err);
        REQUIRE(programs.has_value());
        REQUIRE(programs->layout.hasColor());
        REQUIRE(programs->startDead);
        REQUIRE(programs->rules.size() == 6);
        REQUIRE(programs->rules[0].is<rules::Gravity>());
        REQUIRE(programs->rules[1].is<rules::Age>());
        REQUIRE(programs->emitters.size() == 1);
        REQUIRE_FALSE(programs->emit.empty());
    }

    SECTION("custom uniforms precede rule parameters") {
        auto programs = SimulationBuilder()
            .uniform("wind", glm::vec3(0.0f))
            .rule(rules::Drag{})
            .compile(&err);
        REQUIRE(programs.has_value());
        REQUIRE(programs->uniforms.find("wind")->offset < programs->uniforms.find("rule0_coefficient")->offset);
    }
}
