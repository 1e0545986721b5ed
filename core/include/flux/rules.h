#pragma once

/**
 * @file rules.h
 * @brief Rule catalogue and its lowering to WGSL
 *
 * A rule is one step of the per-particle update. Rules run in list order
 * inside a single compute invocation and mutate the local `p: Particle`.
 * Each rule knows whether it reads neighbors, which of its parameters live
 * in the uniform buffer (f32 and vec3 values, named `rule<i>_<name>`), and
 * how to lower itself to WGSL.
 *
 * Neighbor-reading rules lower to three parts (setup before the loop, a
 * body inside the loop, and a post step after it) so the shader builder can
 * merge contiguous ones into one loop.
 *
 * @par Example
 * @code
 * std::vector<Rule> list = {
 *     rules::Gravity{9.8f},
 *     rules::Separate{0.05f, 5.0f},
 *     rules::typed(1, rules::Drag{2.0f}),
 *     rules::BounceWalls{},
 * };
 * @endcode
 */

#include <flux/error.h>
#include <flux/uniforms.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace flux {

class Rule;
class ParticleLayout;
class FieldRegistry;

namespace rules {

// -----------------------------------------------------------------------------
// Forces
// -----------------------------------------------------------------------------

struct Gravity { float strength = 9.8f; };
struct Acceleration { glm::vec3 acceleration{0.0f}; };
struct Drag { float coefficient = 1.0f; };

struct PointGravity {
    glm::vec3 point{0.0f};
    float strength = 1.0f;
    float softening = 0.01f;
};

struct Vortex {
    glm::vec3 center{0.0f};
    glm::vec3 axis{0.0f, 1.0f, 0.0f};
    float strength = 1.0f;
};

struct Spring {
    glm::vec3 anchor{0.0f};
    float stiffness = 1.0f;
    float damping = 0.1f;
};

struct Orbit {
    glm::vec3 center{0.0f};
    float strength = 1.0f;
};

struct Curl {
    float scale = 2.0f;
    float strength = 1.0f;
};

struct Turbulence {
    float scale = 2.0f;
    float strength = 1.0f;
};

struct Wander {
    float strength = 1.0f;
    float frequency = 1.0f;
};

// -----------------------------------------------------------------------------
// Boundaries & constraints
// -----------------------------------------------------------------------------

struct BounceWalls {};
struct WrapWalls {};

struct SpeedLimit {
    float min = 0.0f;
    float max = 1.0f;
};

// -----------------------------------------------------------------------------
// Neighbor interactions
// -----------------------------------------------------------------------------

struct Separate { float radius = 0.05f; float strength = 1.0f; };
struct Cohere { float radius = 0.15f; float strength = 1.0f; };
struct Align { float radius = 0.1f; float strength = 1.0f; };

struct Collide {
    float radius = 0.05f;
    float restitution = 0.8f;
};

struct NBodyGravity {
    float strength = 0.01f;
    float softening = 0.01f;
    float radius = 0.3f;
};

struct LennardJones {
    float epsilon = 1.0f;
    float sigma = 0.03f;
    float cutoff = 0.08f;
};

struct Pressure {
    float radius = 0.1f;
    float strength = 1.0f;
    float targetDensity = 8.0f;
};

struct Viscosity {
    float radius = 0.1f;
    float strength = 0.5f;
};

/// Steer toward the nearest neighbor of targetType
struct Chase {
    uint32_t selfType = 0;
    uint32_t targetType = 1;
    float radius = 0.2f;
    float strength = 1.0f;
};

/// Steer away from the nearest neighbor of threatType
struct Evade {
    uint32_t selfType = 1;
    uint32_t threatType = 0;
    float radius = 0.2f;
    float strength = 1.0f;
};

/// Per-frame, per-pair chance of a fromType particle becoming toType
struct Convert {
    uint32_t fromType = 0;
    uint32_t triggerType = 1;
    uint32_t toType = 1;
    float radius = 0.1f;
    float probability = 0.01f;
};

/// Relax a particle field toward the neighborhood mean
struct Diffuse {
    std::string field;
    float radius = 0.1f;
    float rate = 1.0f;
};

/**
 * @brief Particle-life style force table
 *
 * attraction and radius are row-major numTypes x numTypes tables indexed
 * by [self][other]. They are baked into the shader.
 */
struct InteractionMatrix {
    uint32_t numTypes = 2;
    std::vector<float> attraction;
    std::vector<float> radius;
    float strength = 1.0f;
    float beta = 0.3f;
};

/// Raw WGSL run once per neighbor (`other`, `other_idx`, `neighbor_dir`, `neighbor_dist`)
struct NeighborCustom {
    std::string code;
    float radius = 0.0f;  ///< 0 = spatial cell size
};

// -----------------------------------------------------------------------------
// Particle state
// -----------------------------------------------------------------------------

/// Deplete charge while trigger is above threshold, regenerate otherwise
struct Refractory {
    std::string trigger = "trigger";
    std::string charge = "charge";
    float threshold = 0.5f;
    float depletionRate = 1.0f;
    float regenRate = 0.2f;
};

/**
 * @brief Phase oscillator coupled through a vector field
 *
 * Each particle deposits its phase direction into @p field and advances
 * toward the locally sensed mean direction. @p onFire runs when the phase
 * wraps.
 */
struct Sync {
    std::string phaseField = "phase";
    float frequency = 1.0f;
    std::string field;
    float emitAmount = 0.5f;
    float coupling = 0.5f;
    float detectionThreshold = 0.01f;
    std::string onFire;
    std::optional<std::string> frequencyField;  ///< Per-particle frequency
};

/// Hooke springs along u32 index fields (NO_PARTICLE = unbonded)
struct BondSprings {
    std::vector<std::string> bonds;
    float stiffness = 50.0f;
    float damping = 1.0f;
    float restLength = 0.05f;
    std::optional<float> maxStretch;  ///< Break when length exceeds restLength * maxStretch
};

struct AgentTransition {
    uint32_t to = 0;
    std::string condition;  ///< WGSL bool expression
    int32_t priority = 0;   ///< Higher is checked first
};

struct AgentState {
    uint32_t id = 0;
    std::string name;
    std::string onEnter;
    std::string onUpdate;
    std::string onExit;
    std::vector<AgentTransition> transitions;
};

struct Agent {
    std::string stateField = "state";
    std::string prevStateField = "prev_state";
    std::optional<std::string> timerField;
    std::vector<AgentState> states;
};

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

struct Age {};
struct Lifetime { float duration = 2.0f; };
struct FadeOut { float duration = 2.0f; };
struct ShrinkOut { float duration = 2.0f; };

struct ColorOverLife {
    glm::vec3 start{1.0f};
    glm::vec3 end{0.0f};
    float duration = 2.0f;
};

struct RespawnBelow {
    float thresholdY = -1.0f;
    float spawnY = 1.0f;
    bool resetVelocity = true;
};

// -----------------------------------------------------------------------------
// Escape hatches & wrappers
// -----------------------------------------------------------------------------

struct Custom { std::string code; };

/// Run @p inner only for particles of selfType (and, for neighbor rules, others of otherType)
struct Typed {
    uint32_t selfType = 0;
    std::optional<uint32_t> otherType;
    std::shared_ptr<const Rule> inner;
};

} // namespace rules

// =============================================================================
// Rule
// =============================================================================

class Rule {
public:
    using Variant = std::variant<
        rules::Gravity, rules::Acceleration, rules::Drag,
        rules::BounceWalls, rules::WrapWalls, rules::SpeedLimit,
        rules::Separate, rules::Cohere, rules::Align, rules::Collide,
        rules::NBodyGravity, rules::PointGravity, rules::LennardJones,
        rules::Pressure, rules::Viscosity,
        rules::Curl, rules::Turbulence, rules::Wander,
        rules::Vortex, rules::Spring, rules::Orbit,
        rules::Chase, rules::Evade, rules::Convert,
        rules::Refractory, rules::Diffuse, rules::Sync,
        rules::Typed, rules::InteractionMatrix, rules::BondSprings, rules::Agent,
        rules::Age, rules::Lifetime, rules::FadeOut, rules::ShrinkOut,
        rules::ColorOverLife, rules::RespawnBelow,
        rules::Custom, rules::NeighborCustom>;

    Rule() : m_rule(rules::Custom{}) {}

    template<typename T,
             typename = std::enable_if_t<std::is_constructible_v<Variant, T&&> &&
                                         !std::is_same_v<std::decay_t<T>, Rule>>>
    Rule(T&& rule) : m_rule(std::forward<T>(rule)) {}

    template<typename T>
    bool is() const { return std::holds_alternative<T>(m_rule); }

    template<typename T>
    const T& as() const { return std::get<T>(m_rule); }

    template<typename T>
    T& as() { return std::get<T>(m_rule); }

    const Variant& variant() const { return m_rule; }
    Variant& variant() { return m_rule; }

private:
    Variant m_rule;
};

namespace rules {

Typed typed(uint32_t selfType, Rule inner);
Typed typed(uint32_t selfType, uint32_t otherType, Rule inner);

} // namespace rules

// =============================================================================
// Rule queries
// =============================================================================

/// Catalogue name ("Gravity", "BounceWalls", ...)
const char* ruleName(const Rule& rule);

bool requiresNeighbors(const Rule& rule);

/// Largest query radius of a neighbor rule at its initial parameters (0 otherwise)
float neighborRadius(const Rule& rule);

/// Name of the parameter that bounds the neighbor query ("radius", "cutoff"), or nullptr
const char* radiusParameter(const Rule& rule);

/// Parameters that live in the uniform buffer, unprefixed, with initial values
std::vector<UniformDecl> dynamicParameters(const Rule& rule);

/// Uniform name for a rule parameter ("rule3_strength")
std::string ruleParamName(uint32_t index, const std::string& param);

/// dynamicParameters() of every rule, prefixed with its list index
std::vector<UniformDecl> ruleUniforms(const std::vector<Rule>& list);

// =============================================================================
// Lowering
// =============================================================================

struct RuleContext {
    float bounds = 1.0f;
    uint32_t index = 0;
    const ParticleLayout* layout = nullptr;  ///< Optional; enables field checks
    const FieldRegistry* fields = nullptr;   ///< Optional; needed by Sync
    float cellSize = 0.1f;
    bool colorAssigned = false;  ///< An earlier rule sets the color outright each frame
};

/**
 * @brief WGSL produced by one rule
 *
 * Non-neighbor rules fill @c body. Neighbor rules fill @c setup (function
 * scope declarations), @c neighbor (run per neighbor), @c post (after the
 * loop) and @c radius (a WGSL f32 expression for the loop radius).
 * @c functions holds module-scope declarations.
 */
struct RuleCode {
    std::string functions;
    std::string setup;
    std::string neighbor;
    std::string post;
    std::string body;
    std::string radius;
};

/// @brief Check parameters and referenced fields
/// @return Empty when the rule can be lowered in @p ctx
std::optional<BuildError> validateRule(const Rule& rule, const RuleContext& ctx);

RuleCode lowerRule(const Rule& rule, const RuleContext& ctx);

/// @brief Self-contained WGSL block for one rule
///
/// Neighbor rules are wrapped in their own neighbor loop.
std::string toWgsl(const Rule& rule, const RuleContext& ctx);
std::string toWgsl(const Rule& rule, float bounds, uint32_t index);

} // namespace flux
