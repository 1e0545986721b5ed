/**
 * @file test_config.cpp
 * @brief Unit tests for JSON config persistence
 *
 * A saved and reloaded config must build the same programs; loading is
 * lenient about bad values and reports unreadable or unparseable files.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <flux/config.h>
#include <filesystem>
#include <fstream>

using namespace flux;
using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

SimConfig richConfig() {
    SimConfig config;
    config.name = "Round Trip";
    config.particleCount = 2048;
    config.bounds = 1.0f;
    config.spatial = SpatialConfig{0.1f, 0, 24};
    config.schema = ParticleSchema::basic();
    config.schema.field("charge", FieldType::F32).color();

    config.spawn.shape = spawn::Shell{0.2f, 0.8f};
    config.spawn.velocity = spawn::Swirl{0.3f};
    config.spawn.color = spawn::Gradient{glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    config.spawn.typeWeights = {3.0f, 1.0f};
    config.spawn.seed = 1234;

    rules::InteractionMatrix matrix;
    matrix.numTypes = 2;
    matrix.attraction = {0.5f, -0.3f, 0.2f, 1.0f};
    matrix.radius = {0.08f, 0.1f, 0.06f, 0.09f};

    config.rules = {
        rules::Gravity{1.5f},
        rules::PointGravity{glm::vec3(0.0f, 0.2f, 0.0f), 0.7f, 0.02f},
        rules::Separate{0.04f, 3.0f},
        rules::typed(1, 0, rules::Cohere{0.09f, 0.5f}),
        matrix,
        rules::typed(1, rules::Drag{0.8f}),
        rules::Custom{"p.charge = p.charge * 0.99;"},
        rules::Lifetime{3.0f},
        rules::FadeOut{3.0f},
        rules::BounceWalls{},
    };

    emitters::Cone cone;
    cone.position = glm::vec3(0.0f, -0.5f, 0.0f);
    cone.rate = 300.0f;
    config.emitters.push_back(Emitter(cone).withType(1).withColor(glm::vec3(1.0f, 0.5f, 0.0f)));

    SubEmitter sub;
    sub.parentType = 1;
    sub.childType = 0;
    sub.count = 4;
    sub.childLifetime = 0.5f;
    config.subEmitters.push_back(sub);

    FieldConfig trail;
    trail.name = "trail";
    trail.resolution = 32;
    trail.decay = 0.95f;
    config.fields.push_back(trail);

    config.uniforms.push_back({"wind", glm::vec3(0.1f, 0.0f, 0.0f)});
    config.uniforms.push_back({"pulse", 0.25f});
    config.customShaders.fragment = "color.a = color.a * 0.8;";

    config.blend = BlendMode::Additive;
    config.shape = ParticleShape::Glow;
    config.camera.distance = 4.0f;
    return config;
}

fs::path tempPath(const std::string& name) {
    return fs::temp_directory_path() / ("flux_test_" + name);
}

} // namespace

// =============================================================================
// Round Trip
// =============================================================================

TEST_CASE("Config round trip", "[config]") {
    SimConfig original = richConfig();
    BuildError err;
    auto before = original.toBuilder().compile(&err);
    REQUIRE(before.has_value());

    SECTION("in memory") {
        std::vector<std::string> warnings;
        SimConfig loaded = fromJson(toJson(original), &warnings);
        REQUIRE(warnings.empty());

        auto after = loaded.toBuilder().compile(&err);
        REQUIRE(after.has_value());
        REQUIRE(after->simulate == before->simulate);
        REQUIRE(after->emit == before->emit);
        REQUIRE(after->subEmit == before->subEmit);
        REQUIRE(after->render == before->render);
    }

    SECTION("through a file") {
        fs::path path = tempPath("roundtrip.json");
        REQUIRE(saveConfig(path.string(), original));

        ConfigLoadResult result = loadConfig(path.string());
        REQUIRE(result.status == ConfigLoadStatus::Ok);
        REQUIRE(result.warnings.empty());
        REQUIRE(result.config.name == "Round Trip");
        REQUIRE(result.config.particleCount == 2048);
        REQUIRE(result.config.spawn.seed == 1234);
        REQUIRE(result.config.blend == BlendMode::Additive);
        REQUIRE(result.config.camera.distance == 4.0f);

        auto after = result.config.toBuilder().compile(&err);
        REQUIRE(after.has_value());
        REQUIRE(after->simulate == before->simulate);
        REQUIRE(after->uniforms.size() == before->uniforms.size());
        fs::remove(path);
    }

    SECTION("document shape") {
        json doc = toJson(original);
        REQUIRE(doc["rules"].size() == original.rules.size());
        REQUIRE(doc["rules"][0]["type"] == "Gravity");
        REQUIRE(doc["rules"][3]["type"] == "Typed");
        REQUIRE(doc["rules"][3]["rule"]["type"] == "Cohere");
        REQUIRE(doc["emitters"][0]["type"] == "Cone");
        REQUIRE(doc["emitters"][0]["particle_type"] == 1);
        REQUIRE(doc["fields"][0]["kind"] == "scalar");
        REQUIRE(doc["schema"]["color"] == "color");
        REQUIRE(doc["visuals"]["blend"] == blendModeName(BlendMode::Additive));
    }
}

TEST_CASE("Lifecycle presets persist by name", "[config][lifecycle]") {
    SimConfig config;
    config.lifecycle = LifecycleConfig{LifecyclePreset::Fountain, glm::vec3(0.0f, -0.8f, 0.0f), 400.0f};

    json doc = toJson(config);
    REQUIRE(doc["lifecycle"]["preset"] == "fountain");

    SimConfig loaded = fromJson(doc);
    REQUIRE(loaded.lifecycle.has_value());
    REQUIRE(loaded.lifecycle->preset == LifecyclePreset::Fountain);
    REQUIRE(loaded.lifecycle->rate == 400.0f);

    auto programs = loaded.toBuilder().compile();
    REQUIRE(programs.has_value());
    REQUIRE(programs->startDead);
    REQUIRE(programs->emitters.size() == 1);
}

// =============================================================================
// Lenient Loading
// =============================================================================

TEST_CASE("Lenient config loading", "[config][errors]") {
    std::vector<std::string> warnings;

    SECTION("wrong value type keeps the default") {
        json doc = {{"particle_count", "lots"}, {"bounds", 2.0}};
        SimConfig config = fromJson(doc, &warnings);
        REQUIRE(config.particleCount == 5000);
        REQUIRE(config.bounds == 2.0f);
        REQUIRE(warnings.size() == 1);
        REQUIRE_THAT(warnings[0], ContainsSubstring("particle_count"));
    }

    SECTION("unknown keys are ignored") {
        json doc = {{"mystery", 1}, {"name", "Quiet"}};
        SimConfig config = fromJson(doc, &warnings);
        REQUIRE(config.name == "Quiet");
        REQUIRE(warnings.empty());
    }

    SECTION("unknown rule types are skipped") {
        json doc = {{"rules", json::array({
            {{"type", "Gravity"}, {"strength", 3.0}},
            {{"type", "Warp"}},
            {{"strength", 1.0}},
        })}};
        SimConfig config = fromJson(doc, &warnings);
        REQUIRE(config.rules.size() == 1);
        REQUIRE(config.rules[0].as<rules::Gravity>().strength == 3.0f);
        REQUIRE(warnings.size() == 2);
    }

    SECTION("missing rule parameters keep their defaults") {
        auto rule = ruleFromJson({{"type", "Separate"}, {"strength", 4.0}});
        REQUIRE(rule.has_value());
        REQUIRE(rule->as<rules::Separate>().strength == 4.0f);
        REQUIRE(rule->as<rules::Separate>().radius == rules::Separate{}.radius);
    }

    SECTION("schema entries with unsupported types fail at build") {
        json doc = {{"schema", {{"fields", json::array({
            {{"name", "position"}, {"type", "vec3"}},
            {{"name", "velocity"}, {"type", "vec3"}},
            {{"name", "weight"}, {"type", "f64"}},
        })}}}};
        SimConfig config = fromJson(doc, &warnings);
        REQUIRE(warnings.empty());

        BuildError err;
        REQUIRE_FALSE(config.toBuilder().compile(&err).has_value());
        REQUIRE(err.kind == ErrorKind::UnsupportedFieldType);
    }

    SECTION("a non-object document gives defaults") {
        SimConfig config = fromJson(json::array({1, 2, 3}), &warnings);
        REQUIRE(config.name == "Untitled");
        REQUIRE_FALSE(warnings.empty());
    }
}

TEST_CASE("Config file status", "[config][files]") {
    SECTION("missing file is unreadable") {
        ConfigLoadResult result = loadConfig(tempPath("does_not_exist.json").string());
        REQUIRE(result.status == ConfigLoadStatus::Unreadable);
    }

    SECTION("directory is unreadable") {
        ConfigLoadResult result = loadConfig(fs::temp_directory_path().string());
        REQUIRE(result.status == ConfigLoadStatus::Unreadable);
    }

    SECTION("invalid JSON loads defaults") {
        fs::path path = tempPath("invalid.json");
        {
            std::ofstream out(path);
            out << "{ \"name\": \"broken\", ";
        }
        ConfigLoadResult result = loadConfig(path.string());
        REQUIRE(result.status == ConfigLoadStatus::Invalid);
        REQUIRE(result.config.name == "Untitled");
        REQUIRE_FALSE(result.warnings.empty());
        fs::remove(path);
    }
}

TEST_CASE("Bundled example configs compile", "[config][examples]") {
    for (const char* name : {"boids.json", "fire.json", "particle_life.json"}) {
        fs::path path = fs::path(FLUX_EXAMPLES_DIR) / name;
        INFO(path.string());

        ConfigLoadResult result = loadConfig(path.string());
        REQUIRE(result.status == ConfigLoadStatus::Ok);
        REQUIRE(result.warnings.empty());

        BuildError err;
        auto programs = result.config.toBuilder().compile(&err);
        INFO(err.toString());
        REQUIRE(programs.has_value());
    }
}
