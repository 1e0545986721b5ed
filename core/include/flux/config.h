#pragma once

/**
 * @file config.h
 * @brief JSON persistence of a simulation setup
 *
 * SimConfig mirrors SimulationBuilder for everything that can be written to
 * a file: schema, spawn settings, rules, emitters, fields, custom uniforms
 * and shaders, visuals and camera. Closures (spawn functions, update and ui
 * callbacks) are not persisted.
 *
 * Loading is lenient. Unknown keys are ignored, a value of the wrong JSON
 * type keeps its default and adds a warning, and an unparseable document
 * yields the defaults with status Invalid.
 *
 * @par Example
 * @code
 * flux::ConfigLoadResult loaded = flux::loadConfig("boids.json");
 * if (loaded.status == flux::ConfigLoadStatus::Unreadable) return 1;
 * auto sim = loaded.config.toBuilder().build(*gpu, &err);
 * @endcode
 */

#include <flux/camera.h>
#include <flux/emitter.h>
#include <flux/field.h>
#include <flux/layout.h>
#include <flux/lifecycle.h>
#include <flux/rules.h>
#include <flux/shader_builder.h>
#include <flux/simulation.h>
#include <flux/spatial.h>
#include <flux/spawn.h>
#include <flux/uniforms.h>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flux {

struct CameraConfig {
    float distance = 3.0f;
    float azimuth = 0.0f;
    float elevation = 0.3f;
    float fov = 45.0f;
};

struct LifecycleConfig {
    LifecyclePreset preset = LifecyclePreset::None;
    glm::vec3 position{0.0f};
    float rate = 100.0f;  ///< Particle count for Explosion
};

struct SimConfig {
    std::string name = "Untitled";
    uint32_t particleCount = 5000;
    float bounds = 1.0f;
    float particleSize = 0.015f;
    SpatialConfig spatial{0.1f, 32};

    ParticleSchema schema = ParticleSchema::basic();
    SpawnConfig spawn;

    std::vector<Rule> rules = {rules::Gravity{2.0f}, rules::Drag{0.5f}, rules::BounceWalls{}};
    std::vector<Emitter> emitters;
    std::vector<SubEmitter> subEmitters;
    std::vector<FieldConfig> fields;
    std::vector<UniformDecl> uniforms;
    CustomShaders customShaders;
    std::optional<LifecycleConfig> lifecycle;
    bool startDead = false;

    BlendMode blend = BlendMode::Alpha;
    ParticleShape shape = ParticleShape::Circle;
    glm::vec3 background{0.02f, 0.02f, 0.04f};
    CameraConfig camera;

    /// @brief Builder carrying every persisted setting
    SimulationBuilder toBuilder() const;
};

enum class ConfigLoadStatus {
    Ok,
    Invalid,     ///< Not parseable; defaults were loaded
    Unreadable   ///< Missing or unreadable file
};

struct ConfigLoadResult {
    SimConfig config;
    ConfigLoadStatus status = ConfigLoadStatus::Ok;
    std::vector<std::string> warnings;
};

nlohmann::json toJson(const SimConfig& config);

/// @brief Read a document; problems are appended to @p warnings
SimConfig fromJson(const nlohmann::json& doc, std::vector<std::string>* warnings = nullptr);

ConfigLoadResult loadConfig(const std::string& path);
bool saveConfig(const std::string& path, const SimConfig& config);

/// Number for scalars, array for vectors
nlohmann::json valueToJson(const Value& value);

/// Single rule as {"type": "<RuleName>", ...params}
nlohmann::json ruleToJson(const Rule& rule);
std::optional<Rule> ruleFromJson(const nlohmann::json& j, std::vector<std::string>* warnings = nullptr);

} // namespace flux
