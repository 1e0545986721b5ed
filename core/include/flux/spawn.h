#pragma once

/**
 * @file spawn.h
 * @brief Initial particle state generation
 *
 * A SpawnConfig describes where particles start (shape), how they move
 * (initial velocity), their color and their type mix. Spawner applies it to
 * host records with a seeded generator, so the same config always yields
 * the same initial population.
 */

#include <flux/layout.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace flux {

namespace spawn {

struct Cube { float size = 0.5f; };          ///< Half-extent
struct Sphere { float radius = 0.5f; };      ///< Uniform inside the ball
struct Shell { float inner = 0.3f; float outer = 1.0f; };
struct Ring { float radius = 0.5f; float thickness = 0.05f; };  ///< In the xz plane
struct Point {};
struct Line { float length = 1.0f; };        ///< Along x
struct Plane { float width = 1.0f; float depth = 1.0f; };  ///< At y = 0

struct Zero {};
struct RandomDirection { float speed = 0.1f; };
struct Outward { float speed = 0.1f; };
struct Inward { float speed = 0.1f; };
struct Swirl { float speed = 0.1f; };        ///< Tangent around the y axis
struct Directional { glm::vec3 direction{0.0f, 1.0f, 0.0f}; float speed = 0.1f; };

struct UniformColor { glm::vec3 color{1.0f}; };
struct RandomHue { float saturation = 0.8f; float value = 0.9f; };
struct ByPosition {};
struct ByVelocity {};
struct Gradient { glm::vec3 start{1.0f, 0.0f, 0.0f}; glm::vec3 end{0.0f, 0.0f, 1.0f}; };  ///< By slot index

} // namespace spawn

using SpawnShape = std::variant<spawn::Cube, spawn::Sphere, spawn::Shell, spawn::Ring,
                                spawn::Point, spawn::Line, spawn::Plane>;

using InitialVelocity = std::variant<spawn::Zero, spawn::RandomDirection, spawn::Outward,
                                     spawn::Inward, spawn::Swirl, spawn::Directional>;

using ColorMode = std::variant<spawn::UniformColor, spawn::RandomHue, spawn::ByPosition,
                               spawn::ByVelocity, spawn::Gradient>;

const char* spawnShapeName(const SpawnShape& shape);
const char* initialVelocityName(const InitialVelocity& velocity);
const char* colorModeName(const ColorMode& mode);

struct SpawnConfig {
    SpawnShape shape = spawn::Sphere{};
    InitialVelocity velocity = spawn::RandomDirection{};
    ColorMode color = spawn::RandomHue{};

    /// Relative weight per particle_type; empty means every particle is type 0
    std::vector<float> typeWeights;

    uint32_t seed = 42;
};

/// Host-side HSV to RGB, all components in [0, 1]
glm::vec3 hsvToRgb(float h, float s, float v);

/**
 * @brief Fills particle records from a SpawnConfig
 *
 * Records must come from a layout with position and velocity. Color is only
 * written when the layout has a color field, particle_type only when type
 * weights are given.
 */
class Spawner {
public:
    explicit Spawner(SpawnConfig config);

    void apply(ParticleRecord& record, uint32_t index, uint32_t count);

    glm::vec3 samplePosition();
    glm::vec3 sampleVelocity(const glm::vec3& position);
    glm::vec3 sampleColor(const glm::vec3& position, const glm::vec3& velocity,
                          uint32_t index, uint32_t count);
    uint32_t sampleType();

private:
    float uniform01();
    glm::vec3 randomDirection();

    SpawnConfig m_config;
    std::mt19937 m_rng;
};

} // namespace flux
