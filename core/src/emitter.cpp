// Flux - Emitter Implementation

#include <flux/emitter.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace flux {

namespace {

// Kind ids shared with the emit pass
constexpr uint32_t KIND_POINT = 0;
constexpr uint32_t KIND_BURST = 1;
constexpr uint32_t KIND_CONE = 2;
constexpr uint32_t KIND_SPHERE = 3;
constexpr uint32_t KIND_BOX = 4;

bool finite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

float Emitter::rate() const {
    return std::visit([](const auto& s) -> float {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, emitters::Burst>) {
            return static_cast<float>(s.count);
        } else {
            return s.rate;
        }
    }, shape);
}

const char* emitterKindName(const Emitter& emitter) {
    switch (emitter.shape.index()) {
        case KIND_POINT: return "Point";
        case KIND_BURST: return "Burst";
        case KIND_CONE: return "Cone";
        case KIND_SPHERE: return "Sphere";
        case KIND_BOX: return "Box";
    }
    return "Unknown";
}

std::optional<BuildError> validateEmitter(const Emitter& emitter) {
    auto fail = [&](const std::string& msg) {
        return makeError(ErrorKind::InvalidEmitter,
                         std::string(emitterKindName(emitter)) + " emitter: " + msg);
    };

    if (!emitter.isBurst() && !(emitter.rate() >= 0.0f)) {
        return fail("rate must be non-negative");
    }
    if (const auto* cone = std::get_if<emitters::Cone>(&emitter.shape)) {
        if (!finite(cone->direction)) return fail("direction must be finite");
        if (cone->spread < 0.0f) return fail("spread must be non-negative");
    }
    if (const auto* sphere = std::get_if<emitters::Sphere>(&emitter.shape)) {
        if (sphere->radius < 0.0f) return fail("radius must be non-negative");
    }
    if (const auto* box = std::get_if<emitters::Box>(&emitter.shape)) {
        if (box->min.x > box->max.x || box->min.y > box->max.y || box->min.z > box->max.z) {
            return fail("min must not exceed max");
        }
    }
    return std::nullopt;
}

// =============================================================================
// EmissionScheduler
// =============================================================================

EmissionScheduler::EmissionScheduler(std::vector<Emitter> emitters)
    : m_emitters(std::move(emitters))
    , m_accumulators(m_emitters.size(), 0.0)
    , m_burstPending(m_emitters.size(), true)
    , m_budgets(m_emitters.size(), 0) {
}

const std::vector<uint32_t>& EmissionScheduler::advance(float dt) {
    for (size_t i = 0; i < m_emitters.size(); ++i) {
        const Emitter& e = m_emitters[i];
        uint32_t budget = 0;
        if (e.isBurst()) {
            if (m_burstPending[i]) {
                budget = std::get<emitters::Burst>(e.shape).count;
                m_burstPending[i] = false;
            }
        } else {
            m_accumulators[i] += static_cast<double>(std::max(e.rate(), 0.0f)) * dt;
            double whole = std::floor(m_accumulators[i]);
            m_accumulators[i] -= whole;
            budget = static_cast<uint32_t>(whole);
        }
        m_budgets[i] = budget;
        m_total += budget;
    }
    return m_budgets;
}

void EmissionScheduler::triggerBurst() {
    for (size_t i = 0; i < m_emitters.size(); ++i) {
        if (m_emitters[i].isBurst()) m_burstPending[i] = true;
    }
}

bool EmissionScheduler::triggerBurst(uint32_t index) {
    if (index >= m_emitters.size() || !m_emitters[index].isBurst()) return false;
    m_burstPending[index] = true;
    return true;
}

bool EmissionScheduler::setRate(uint32_t index, float rate) {
    if (index >= m_emitters.size() || m_emitters[index].isBurst() || !(rate >= 0.0f)) {
        return false;
    }
    std::visit([rate](auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (!std::is_same_v<T, emitters::Burst>) {
            s.rate = rate;
        }
    }, m_emitters[index].shape);
    return true;
}

void EmissionScheduler::adoptState(const EmissionScheduler& other) {
    size_t n = std::min(m_emitters.size(), other.m_emitters.size());
    for (size_t i = 0; i < n; ++i) {
        m_accumulators[i] = other.m_accumulators[i];
        m_burstPending[i] = other.m_burstPending[i];
    }
    m_total = other.m_total;
}

// =============================================================================
// GPU packing
// =============================================================================

EmitterGpuData packEmitter(const Emitter& emitter, uint32_t budget) {
    EmitterGpuData d{};
    d.a = glm::vec4(0.0f);
    d.b = glm::vec4(0.0f);
    d.c = glm::vec4(0.0f);
    d.color = glm::vec4(0.0f);
    d.kind = static_cast<uint32_t>(emitter.shape.index());
    d.budget = budget;
    d.particleType = emitter.particleType.value_or(0);
    d.hasType = emitter.particleType ? 1u : 0u;
    if (emitter.color) {
        d.color = glm::vec4(*emitter.color, 1.0f);
    }

    std::visit([&d](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, emitters::Point>) {
            d.a = glm::vec4(s.position, s.speed);
        } else if constexpr (std::is_same_v<T, emitters::Burst>) {
            d.a = glm::vec4(s.position, s.speed);
        } else if constexpr (std::is_same_v<T, emitters::Cone>) {
            d.a = glm::vec4(s.position, s.speed);
            d.b = glm::vec4(s.direction, s.spread);
        } else if constexpr (std::is_same_v<T, emitters::Sphere>) {
            d.a = glm::vec4(s.center, s.speed);
            d.b = glm::vec4(0.0f, 0.0f, 0.0f, s.radius);
        } else {
            d.a = glm::vec4(s.min, 0.0f);
            d.b = glm::vec4(s.max, 0.0f);
            d.c = glm::vec4(s.velocity, 0.0f);
        }
    }, emitter.shape);
    return d;
}

std::string emitterStructsWgsl() {
    return R"(
struct EmitterData {
    a: vec4<f32>,
    b: vec4<f32>,
    c: vec4<f32>,
    color: vec4<f32>,
    kind: u32,
    budget: u32,
    particle_type: u32,
    has_type: u32,
};

struct EmitParams {
    frame: u32,
    num_emitters: u32,
    num_particles: u32,
    time: f32,
};
)";
}

// =============================================================================
// Sub-emitters
// =============================================================================

std::optional<BuildError> validateSubEmitter(const SubEmitter& sub) {
    if (sub.count == 0) {
        return makeError(ErrorKind::InvalidEmitter, "sub-emitter count must be positive");
    }
    if (sub.speedMin > sub.speedMax) {
        return makeError(ErrorKind::InvalidEmitter, "sub-emitter speed_min exceeds speed_max");
    }
    if (sub.spawnRadius < 0.0f) {
        return makeError(ErrorKind::InvalidEmitter, "sub-emitter spawn_radius must be non-negative");
    }
    if (sub.childLifetime && !(*sub.childLifetime > 0.0f)) {
        return makeError(ErrorKind::InvalidEmitter, "sub-emitter child_lifetime must be positive");
    }
    return std::nullopt;
}

std::string deathStructsWgsl(bool atomicCount) {
    std::ostringstream ss;
    ss << "\nconst MAX_DEATH_EVENTS: u32 = " << MAX_DEATH_EVENTS << "u;\n";
    ss << R"(
struct DeathEvent {
    position: vec3<f32>,
    parent_type: u32,
    velocity: vec3<f32>,
    _pad0: u32,
    color: vec3<f32>,
    _pad1: u32,
};

struct DeathBuffer {
)";
    ss << "    count: " << (atomicCount ? "atomic<u32>" : "u32") << ",\n";
    ss << R"(    _pad0: u32,
    _pad1: u32,
    _pad2: u32,
    events: array<DeathEvent, MAX_DEATH_EVENTS>,
};
)";
    return ss.str();
}

} // namespace flux
