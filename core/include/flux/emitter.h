#pragma once

/**
 * @file emitter.h
 * @brief Emitters, sub-emitters and their host-side scheduling
 *
 * Emitters revive dead particle slots. The host decides how many particles
 * each emitter may spawn this frame (EmissionScheduler) and the emit pass
 * hands those budgets out to dead slots with an atomic counter.
 *
 * Sub-emitters spawn children where particles of a parent type die. The
 * simulate pass records deaths into a bounded event buffer; a follow-up
 * pass claims dead slots for the children.
 */

#include <flux/error.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace flux {

namespace emitters {

/// Random directions from a point; speed 0 gives random speeds up to 0.5
struct Point {
    glm::vec3 position{0.0f};
    float rate = 100.0f;
    float speed = 1.0f;
};

/// @p count particles at once on the first frame or when triggered
struct Burst {
    glm::vec3 position{0.0f};
    uint32_t count = 100;
    float speed = 1.0f;
};

struct Cone {
    glm::vec3 position{0.0f};
    glm::vec3 direction{0.0f, 1.0f, 0.0f};
    float speed = 1.0f;
    float spread = 0.3f;  ///< Half-angle in radians
    float rate = 100.0f;
};

/// Spawn on the sphere surface moving outward (inward for negative speed)
struct Sphere {
    glm::vec3 center{0.0f};
    float radius = 0.5f;
    float speed = 0.5f;
    float rate = 100.0f;
};

struct Box {
    glm::vec3 min{-0.5f};
    glm::vec3 max{0.5f};
    glm::vec3 velocity{0.0f};
    float rate = 100.0f;
};

} // namespace emitters

using EmitterShape = std::variant<emitters::Point, emitters::Burst, emitters::Cone,
                                  emitters::Sphere, emitters::Box>;

struct Emitter {
    EmitterShape shape = emitters::Point{};
    std::optional<uint32_t> particleType;
    std::optional<glm::vec3> color;

    Emitter() = default;

    template<typename T, typename = std::enable_if_t<std::is_constructible_v<EmitterShape, T>>>
    Emitter(T s) : shape(std::move(s)) {}

    Emitter& withType(uint32_t type) { particleType = type; return *this; }
    Emitter& withColor(const glm::vec3& c) { color = c; return *this; }

    bool isBurst() const { return std::holds_alternative<emitters::Burst>(shape); }

    /// Particles per second (burst count for bursts)
    float rate() const;
};

/// "Point", "Burst", "Cone", "Sphere", "Box"
const char* emitterKindName(const Emitter& emitter);

std::optional<BuildError> validateEmitter(const Emitter& emitter);

// =============================================================================
// Emission scheduling
// =============================================================================

/**
 * @brief Per-frame spawn budgets
 *
 * Continuous emitters accumulate rate * dt and release whole particles,
 * carrying the fraction to the next frame. Bursts release their count once
 * and again after each trigger.
 */
class EmissionScheduler {
public:
    EmissionScheduler() = default;
    explicit EmissionScheduler(std::vector<Emitter> emitters);

    /// @brief Advance by @p dt seconds and return the budget of each emitter
    const std::vector<uint32_t>& advance(float dt);

    const std::vector<uint32_t>& budgets() const { return m_budgets; }
    const std::vector<Emitter>& emitters() const { return m_emitters; }

    /// Re-arm every burst emitter
    void triggerBurst();

    /// @brief Re-arm one burst emitter
    /// @return false if @p index is out of range or not a burst
    bool triggerBurst(uint32_t index);

    /// @brief Change the rate of a continuous emitter
    bool setRate(uint32_t index, float rate);

    /// Particles scheduled since construction
    uint64_t totalScheduled() const { return m_total; }

    /// Carry accumulators and pending bursts over from an earlier scheduler
    void adoptState(const EmissionScheduler& other);

private:
    std::vector<Emitter> m_emitters;
    std::vector<double> m_accumulators;
    std::vector<bool> m_burstPending;
    std::vector<uint32_t> m_budgets;
    uint64_t m_total = 0;
};

/// One emitter as read by the emit pass
struct EmitterGpuData {
    glm::vec4 a;       ///< position / center / box min; w = speed
    glm::vec4 b;       ///< direction / box max; w = spread or radius
    glm::vec4 c;       ///< box velocity
    glm::vec4 color;   ///< w = 1 when a color is set
    uint32_t kind;
    uint32_t budget;
    uint32_t particleType;
    uint32_t hasType;
};
static_assert(sizeof(EmitterGpuData) == 80, "EmitterData must be 80 bytes");

EmitterGpuData packEmitter(const Emitter& emitter, uint32_t budget);

/// EmitterData and EmitParams WGSL structs
std::string emitterStructsWgsl();

// =============================================================================
// Sub-emitters
// =============================================================================

constexpr uint32_t MAX_DEATH_EVENTS = 4096;

/// Slots probed per child when looking for a dead particle
constexpr uint32_t SUB_EMIT_PROBE = 64;

struct SubEmitter {
    uint32_t parentType = 0;
    uint32_t childType = 1;
    uint32_t count = 10;
    float speedMin = 0.5f;
    float speedMax = 1.5f;
    float spread = 3.14159265f;       ///< Cone half-angle around the parent velocity
    float inheritVelocity = 0.3f;     ///< Clamped to [0, 1]
    std::optional<float> childLifetime;
    std::optional<glm::vec3> childColor;
    float spawnRadius = 0.0f;
};

std::optional<BuildError> validateSubEmitter(const SubEmitter& sub);

/// Death record written by the simulate pass
struct DeathEvent {
    glm::vec3 position;
    uint32_t parentType;
    glm::vec3 velocity;
    uint32_t pad0;
    glm::vec3 color;
    uint32_t pad1;
};
static_assert(sizeof(DeathEvent) == 48, "DeathEvent must be 48 bytes");

/// Bytes before the event array (atomic count plus padding)
constexpr uint32_t DEATH_HEADER_SIZE = 16;
constexpr uint64_t DEATH_BUFFER_SIZE = DEATH_HEADER_SIZE + uint64_t(MAX_DEATH_EVENTS) * sizeof(DeathEvent);

/// DeathEvent and DeathBuffer WGSL structs; @p atomicCount selects the writer form
std::string deathStructsWgsl(bool atomicCount);

} // namespace flux
