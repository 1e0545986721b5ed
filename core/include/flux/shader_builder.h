#pragma once

/**
 * @file shader_builder.h
 * @brief WGSL program synthesis for one simulation build
 *
 * ShaderBuilder turns a particle layout, uniform layout, field registry and
 * rule list into the WGSL programs a simulation runs each frame:
 *
 * - simulate: one invocation per particle slot, rules inlined in list order,
 *   contiguous neighbor rules sharing one neighbor loop
 * - emit: revives dead slots from the per-frame emitter budgets
 * - sub_emit: spawns children at recorded death events
 * - render: instanced camera-facing quads
 *
 * Bind group indices are assigned contiguously; a group that a build does
 * not need gets no index (see BindGroupPlan).
 *
 * @par Simulate bindings
 * | Group | Binding | Resource |
 * |-------|---------|----------|
 * | 0 | 0 | particles_read (storage, read) |
 * | 0 | 1 | particles_write (storage, read_write) |
 * | 0 | 2 | uniforms (uniform) |
 * | grid | 0..2 | grid params, sorted_indices, cell_offsets |
 * | fields | 0..2 | field_deposit, field_data, field_params |
 * | death | 0 | death events (storage, read_write) |
 */

#include <flux/emitter.h>
#include <flux/error.h>
#include <flux/field.h>
#include <flux/layout.h>
#include <flux/rules.h>
#include <flux/spatial.h>
#include <flux/uniforms.h>
#include <optional>
#include <string>
#include <vector>

namespace flux {

enum class ParticleShape {
    Circle,
    Square,
    Glow
};

enum class BlendMode {
    Alpha,
    Additive,
    Opaque
};

const char* particleShapeName(ParticleShape shape);
std::optional<ParticleShape> parseParticleShape(const std::string& name);
const char* blendModeName(BlendMode mode);
std::optional<BlendMode> parseBlendMode(const std::string& name);

/// User WGSL spliced into the generated programs
struct CustomShaders {
    std::string computePrelude;  ///< Module-scope WGSL for the simulate program
    std::string vertex;          ///< Runs at the end of vs_main (`p`, `out`, `corner`, `instance`)
    std::string fragment;        ///< Runs at the end of fs_main (`in`, `color`)
};

struct ShaderConfig {
    float bounds = 1.0f;
    SpatialConfig spatial;
    std::vector<Rule> rules;
    std::vector<SubEmitter> subEmitters;
    bool emitters = false;
    CustomShaders custom;
    ParticleShape shape = ParticleShape::Circle;
};

/// Bind group index of each optional simulate group
struct BindGroupPlan {
    std::optional<uint32_t> grid;
    std::optional<uint32_t> fields;
    std::optional<uint32_t> death;
    uint32_t count = 1;
};

/// Per-draw parameters of the render program
struct RenderParamsData {
    float aspect;
    float particleSize;
    float focal;   ///< Vertical projection scale (proj[1][1])
    float pad;
};
static_assert(sizeof(RenderParamsData) == 16, "RenderParams must be 16 bytes");

class ShaderBuilder {
public:
    /// The layouts and registry must outlive the builder
    ShaderBuilder(const ParticleLayout& layout, const UniformLayout& uniforms,
                  const FieldRegistry& fields, ShaderConfig config);

    /// @brief Check every rule, sub-emitter and the spatial cell size
    std::optional<BuildError> validate() const;

    bool needsNeighbors() const;
    float maxNeighborRadius() const;
    bool recordsDeaths() const { return !m_config.subEmitters.empty(); }
    bool usesFields() const { return !m_fields->empty(); }

    BindGroupPlan bindGroups() const;

    std::string simulateProgram() const;
    std::string emitProgram() const;
    std::string subEmitProgram() const;
    std::string renderProgram() const;

    const ShaderConfig& config() const { return m_config; }

private:
    std::string header() const;
    std::string ruleSegments(std::string& functions) const;
    std::string epilogue() const;
    std::string spawnColor(const std::string& target, const std::string& value) const;

    const ParticleLayout* m_layout;
    const UniformLayout* m_uniforms;
    const FieldRegistry* m_fields;
    ShaderConfig m_config;
};

/// @brief Indent every non-empty line of @p code by @p levels * 4 spaces
std::string indentWgsl(const std::string& code, int levels);

} // namespace flux
