#pragma once

/**
 * @file simulation.h
 * @brief Simulation builder and per-frame scheduler
 *
 * SimulationBuilder collects everything that shapes the generated programs
 * (schema, rules, fields, emitters, custom uniforms and shaders) plus host
 * settings (count, bounds, spawner, callbacks, visuals). compile() produces
 * the WGSL on the CPU; build() turns it into GPU pipelines and buffers.
 *
 * Simulation::frame() runs, in order: host update callback, uniform upload,
 * grid passes (when a rule reads neighbors), emit, simulate, sub-emit, field
 * passes, render (when given a target), then swaps the particle buffers.
 *
 * @par Example
 * @code
 * flux::BuildError err;
 * auto sim = flux::SimulationBuilder()
 *     .particleCount(10000)
 *     .bounds(1.0f)
 *     .spatial(0.1f)
 *     .rule(flux::rules::Gravity{2.0f})
 *     .rule(flux::rules::Separate{0.05f, 5.0f})
 *     .rule(flux::rules::BounceWalls{})
 *     .build(*gpu, &err);
 * if (!sim) std::cerr << err.toString() << "\n";
 * @endcode
 */

#include <flux/camera.h>
#include <flux/emitter.h>
#include <flux/error.h>
#include <flux/field.h>
#include <flux/input.h>
#include <flux/layout.h>
#include <flux/lifecycle.h>
#include <flux/rules.h>
#include <flux/shader_builder.h>
#include <flux/spatial.h>
#include <flux/spawn.h>
#include <flux/uniforms.h>
#include <glm/glm.hpp>
#include <webgpu/webgpu.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flux {

namespace gpu {
class GpuContext;
}

class Simulation;

/// Fills one freshly reset record; called for every slot at build time
using SpawnFunction = std::function<void(ParticleRecord& record, uint32_t index, uint32_t count)>;

/// Runs once per frame before uniforms are uploaded
using UpdateFunction = std::function<void(Simulation& sim, float time, float deltaTime,
                                          const InputSnapshot& input)>;

/// Runs once per frame after the update callback
using UiFunction = std::function<void(Simulation& sim)>;

/// Everything compile() derives from a builder
struct CompiledPrograms {
    ParticleLayout layout;
    UniformLayout uniforms;
    FieldRegistry fields;
    std::vector<Rule> rules;         ///< User rules followed by lifecycle rules
    std::vector<Emitter> emitters;   ///< User emitters followed by lifecycle emitters
    ShaderConfig shaderConfig;
    BindGroupPlan plan;
    bool needsNeighbors = false;
    bool startDead = false;

    std::string simulate;
    std::string emit;      ///< Empty without emitters
    std::string subEmit;   ///< Empty without sub-emitters
    std::string render;
};

class SimulationBuilder {
public:
    SimulationBuilder();

    SimulationBuilder& particleCount(uint32_t count);
    SimulationBuilder& bounds(float halfExtent);
    SimulationBuilder& particleSize(float size);
    SimulationBuilder& schema(const ParticleSchema& schema);

    SimulationBuilder& spatial(float cellSize, uint32_t resolution = 0);
    SimulationBuilder& spatial(const SpatialConfig& config);

    SimulationBuilder& spawner(const SpawnConfig& config);
    SimulationBuilder& spawner(SpawnFunction fn);

    SimulationBuilder& rule(const Rule& rule);
    SimulationBuilder& rules(const std::vector<Rule>& list);
    SimulationBuilder& emitter(const Emitter& emitter);
    SimulationBuilder& subEmitter(const SubEmitter& sub);
    SimulationBuilder& field(const FieldConfig& field);

    /// Custom uniform; the initial value fixes its type
    SimulationBuilder& uniform(const std::string& name, const Value& initial);

    SimulationBuilder& customShaders(const CustomShaders& shaders);
    SimulationBuilder& lifecycle(const Lifecycle& lifecycle);
    SimulationBuilder& startDead(bool dead = true);

    SimulationBuilder& update(UpdateFunction fn);
    SimulationBuilder& ui(UiFunction fn);

    SimulationBuilder& blend(BlendMode mode);
    SimulationBuilder& shape(ParticleShape shape);
    SimulationBuilder& background(const glm::vec3& color);
    SimulationBuilder& camera(const Camera& camera);

    /// @brief Derive layouts and generate every program without a device
    std::optional<CompiledPrograms> compile(BuildError* error = nullptr) const;

    /// @brief Compile, allocate and create pipelines
    /// @return nullptr on failure (details in @p error)
    std::unique_ptr<Simulation> build(gpu::GpuContext& gpu, BuildError* error = nullptr) const;

    uint32_t particleCount() const { return m_count; }
    float bounds() const { return m_bounds; }
    float particleSize() const { return m_particleSize; }
    const ParticleSchema& schema() const { return m_schema; }
    const SpatialConfig& spatial() const { return m_spatial; }
    const SpawnConfig& spawnConfig() const { return m_spawnConfig; }
    const std::vector<Rule>& rules() const { return m_rules; }
    const std::vector<Emitter>& emitters() const { return m_emitters; }
    const std::vector<SubEmitter>& subEmitters() const { return m_subEmitters; }
    const std::vector<FieldConfig>& fields() const { return m_fields; }
    const std::vector<UniformDecl>& uniforms() const { return m_uniforms; }
    BlendMode blendMode() const { return m_blend; }
    const glm::vec3& backgroundColor() const { return m_background; }
    const Camera& cameraSettings() const { return m_camera; }

private:
    friend class Simulation;

    /// Records for every slot, spawned and lifecycle-adjusted
    ParticleBatch spawnBatch(const ParticleLayout& layout, bool startDead) const;

    uint32_t m_count = 5000;
    float m_bounds = 1.0f;
    float m_particleSize = 0.015f;
    ParticleSchema m_schema;
    SpatialConfig m_spatial;
    SpawnConfig m_spawnConfig;
    SpawnFunction m_spawn;
    std::vector<Rule> m_rules;
    std::vector<Emitter> m_emitters;
    std::vector<SubEmitter> m_subEmitters;
    std::vector<FieldConfig> m_fields;
    std::vector<UniformDecl> m_uniforms;
    CustomShaders m_custom;
    std::optional<Lifecycle> m_lifecycle;
    bool m_startDead = false;
    UpdateFunction m_update;
    UiFunction m_ui;
    BlendMode m_blend = BlendMode::Alpha;
    ParticleShape m_shape = ParticleShape::Circle;
    glm::vec3 m_background{0.02f, 0.02f, 0.04f};
    Camera m_camera;
};

class Simulation {
public:
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // -------------------------------------------------------------------------
    /// @name Frame scheduling
    /// @{

    /**
     * @brief Advance one frame of @p deltaTime seconds
     * @param target Color view to render into, or nullptr to skip rendering
     * @return false if the device was lost
     */
    bool frame(float deltaTime, WGPUTextureView target = nullptr);

    /// @brief Render the current particle state without stepping (paused view)
    bool redraw(WGPUTextureView target);

    /// Set camera aspect and input viewport
    void resize(uint32_t width, uint32_t height);

    float time() const { return m_time; }
    uint32_t frameCount() const { return m_frame; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Parameters
    /// @{

    /**
     * @brief Set a custom uniform or rule parameter by its uniform name
     * @return false on unknown name or mismatched type; the buffer is untouched
     */
    bool setUniform(const std::string& name, const Value& value);

    /// @brief Set parameter @p param of the rule at @p ruleIndex
    bool setRuleParam(uint32_t ruleIndex, const std::string& param, const Value& value);

    std::optional<Value> uniform(const std::string& name) const;

    /**
     * @brief Structural change: recompile and recreate everything
     *
     * On failure the running build is kept and false is returned. Particle
     * state carries over when count and layout are unchanged.
     */
    bool rebuild(const SimulationBuilder& builder);

    /// Successful structural rebuilds since construction
    uint32_t rebuildCount() const { return m_rebuildCount; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Emitters
    /// @{

    void triggerBurst();
    bool triggerBurst(uint32_t emitterIndex);
    bool setEmitterRate(uint32_t emitterIndex, float rate);

    /// @brief Spawns requested by all emitters so far
    ///
    /// Requests beyond the free slots of a frame are dropped on the GPU but
    /// still counted, so this is an upper bound on particles emitted.
    uint64_t totalScheduled() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name State access
    /// @{

    /// @brief Copy the current particle buffer to the host
    std::optional<ParticleBatch> readParticles();

    /// @brief Overwrite every particle (both buffers)
    bool writeParticles(const ParticleBatch& batch);

    /// @brief Copy a field's voxels to the host; empty if unknown
    std::vector<float> readField(const std::string& name);

    /// @brief Copy cell_offsets and sorted_indices of the last grid pass
    bool readGrid(std::vector<uint32_t>& cellOffsets, std::vector<uint32_t>& sortedIndices);

    uint32_t particleCount() const;
    const ParticleLayout& layout() const;
    const CompiledPrograms& programs() const;
    const SimulationBuilder& builder() const { return m_builder; }

    InputTracker& input() { return m_input; }
    Camera& camera() { return m_camera; }
    const Camera& camera() const { return m_camera; }

    void setPaused(bool paused) { m_paused = paused; }
    bool paused() const { return m_paused; }

    const BuildError& lastError() const { return m_error; }
    bool hasError() const { return m_hasError; }

    /// @}

private:
    friend class SimulationBuilder;

    struct Pipelines;

    Simulation(gpu::GpuContext& gpu, const SimulationBuilder& builder);

    std::unique_ptr<Pipelines> createPipelines(const SimulationBuilder& builder, BuildError* error);
    void encodeRender(WGPUCommandEncoder encoder, WGPUTextureView target, uint32_t parity);
    void fail(const BuildError& error);

    gpu::GpuContext* m_gpu;
    SimulationBuilder m_builder;
    std::unique_ptr<Pipelines> m_pipelines;
    InputTracker m_input;
    Camera m_camera;
    float m_time = 0.0f;
    uint32_t m_frame = 0;
    uint32_t m_rebuildCount = 0;
    bool m_paused = false;
    BuildError m_error;
    bool m_hasError = false;
};

} // namespace flux
