// Flux - Spawn Implementation

#include <flux/spawn.h>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace flux {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr float TAU = 6.28318530718f;

} // namespace

const char* spawnShapeName(const SpawnShape& shape) {
    static const char* NAMES[] = {"Cube", "Sphere", "Shell", "Ring", "Point", "Line", "Plane"};
    return NAMES[shape.index()];
}

const char* initialVelocityName(const InitialVelocity& velocity) {
    static const char* NAMES[] = {"Zero", "Random", "Outward", "Inward", "Swirl", "Directional"};
    return NAMES[velocity.index()];
}

const char* colorModeName(const ColorMode& mode) {
    static const char* NAMES[] = {"Uniform", "RandomHue", "ByPosition", "ByVelocity", "Gradient"};
    return NAMES[mode.index()];
}

glm::vec3 hsvToRgb(float h, float s, float v) {
    glm::vec3 k(1.0f, 2.0f / 3.0f, 1.0f / 3.0f);
    glm::vec3 p = glm::abs(glm::fract(glm::vec3(h) + k) * 6.0f - glm::vec3(3.0f));
    return v * glm::mix(glm::vec3(1.0f), glm::clamp(p - glm::vec3(1.0f), 0.0f, 1.0f), s);
}

// =============================================================================
// Spawner
// =============================================================================

Spawner::Spawner(SpawnConfig config)
    : m_config(std::move(config))
    , m_rng(m_config.seed) {
}

float Spawner::uniform01() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    return dist(m_rng);
}

glm::vec3 Spawner::randomDirection() {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    while (true) {
        glm::vec3 v(dist(m_rng), dist(m_rng), dist(m_rng));
        float lenSq = glm::dot(v, v);
        if (lenSq > 0.001f && lenSq <= 1.0f) {
            return v / std::sqrt(lenSq);
        }
    }
}

glm::vec3 Spawner::samplePosition() {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    return std::visit(overloaded{
        [&](const spawn::Cube& s) {
            return glm::vec3(dist(m_rng), dist(m_rng), dist(m_rng)) * s.size;
        },
        [&](const spawn::Sphere& s) {
            while (true) {
                glm::vec3 v(dist(m_rng), dist(m_rng), dist(m_rng));
                if (glm::dot(v, v) <= 1.0f) return v * s.radius;
            }
        },
        [&](const spawn::Shell& s) {
            glm::vec3 dir = randomDirection();
            return dir * (s.inner + uniform01() * (s.outer - s.inner));
        },
        [&](const spawn::Ring& s) {
            float angle = uniform01() * TAU;
            float r = s.radius + (uniform01() - 0.5f) * s.thickness;
            float y = (uniform01() - 0.5f) * s.thickness;
            return glm::vec3(std::cos(angle) * r, y, std::sin(angle) * r);
        },
        [&](const spawn::Point&) {
            return glm::vec3(0.0f);
        },
        [&](const spawn::Line& s) {
            return glm::vec3((uniform01() - 0.5f) * s.length, 0.0f, 0.0f);
        },
        [&](const spawn::Plane& s) {
            return glm::vec3((uniform01() - 0.5f) * s.width, 0.0f, (uniform01() - 0.5f) * s.depth);
        },
    }, m_config.shape);
}

glm::vec3 Spawner::sampleVelocity(const glm::vec3& position) {
    auto radial = [&](float speed, float sign) {
        if (glm::length(position) > 0.001f) {
            return glm::normalize(position) * speed * sign;
        }
        return randomDirection() * speed;
    };
    return std::visit(overloaded{
        [&](const spawn::Zero&) { return glm::vec3(0.0f); },
        [&](const spawn::RandomDirection& v) { return randomDirection() * v.speed; },
        [&](const spawn::Outward& v) { return radial(v.speed, 1.0f); },
        [&](const spawn::Inward& v) { return radial(v.speed, -1.0f); },
        [&](const spawn::Swirl& v) {
            glm::vec3 tangent(-position.z, 0.0f, position.x);
            if (glm::length(tangent) > 0.001f) {
                return glm::normalize(tangent) * v.speed;
            }
            return randomDirection() * v.speed;
        },
        [&](const spawn::Directional& v) {
            if (glm::length(v.direction) < 1e-6f) return glm::vec3(0.0f);
            return glm::normalize(v.direction) * v.speed;
        },
    }, m_config.velocity);
}

glm::vec3 Spawner::sampleColor(const glm::vec3& position, const glm::vec3& velocity,
                               uint32_t index, uint32_t count) {
    return std::visit(overloaded{
        [&](const spawn::UniformColor& c) { return c.color; },
        [&](const spawn::RandomHue& c) { return hsvToRgb(uniform01(), c.saturation, c.value); },
        [&](const spawn::ByPosition&) { return position * 0.5f + glm::vec3(0.5f); },
        [&](const spawn::ByVelocity&) {
            float speed = glm::length(velocity);
            return hsvToRgb(glm::fract(speed * 2.0f), 0.9f, 0.9f);
        },
        [&](const spawn::Gradient& c) {
            float t = static_cast<float>(index) / static_cast<float>(std::max(count, 1u));
            return glm::mix(c.start, c.end, t);
        },
    }, m_config.color);
}

uint32_t Spawner::sampleType() {
    const auto& weights = m_config.typeWeights;
    float total = std::accumulate(weights.begin(), weights.end(), 0.0f);
    if (weights.empty() || total <= 0.0f) return 0;

    float pick = uniform01() * total;
    for (uint32_t t = 0; t < weights.size(); ++t) {
        pick -= weights[t];
        if (pick < 0.0f) return t;
    }
    return static_cast<uint32_t>(weights.size() - 1);
}

void Spawner::apply(ParticleRecord& record, uint32_t index, uint32_t count) {
    glm::vec3 position = samplePosition();
    glm::vec3 velocity = sampleVelocity(position);
    record.set("position", position);
    record.set("velocity", velocity);

    const ParticleLayout& layout = record.layout();
    if (layout.hasColor()) {
        record.set(layout.colorField(), sampleColor(position, velocity, index, count));
    }
    if (!m_config.typeWeights.empty()) {
        record.set("particle_type", sampleType());
    }
}

} // namespace flux
