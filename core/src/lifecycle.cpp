// Flux - Lifecycle Presets Implementation

#include <flux/lifecycle.h>

namespace flux {

namespace {

struct PresetName {
    LifecyclePreset preset;
    const char* name;
};

constexpr PresetName PRESET_NAMES[] = {
    {LifecyclePreset::None, "none"},
    {LifecyclePreset::Fire, "fire"},
    {LifecyclePreset::Fountain, "fountain"},
    {LifecyclePreset::Explosion, "explosion"},
    {LifecyclePreset::Smoke, "smoke"},
    {LifecyclePreset::Sparkler, "sparkler"},
    {LifecyclePreset::Rain, "rain"},
};

emitters::Cone upwardCone(const glm::vec3& position, float speed, float spread, float rate) {
    emitters::Cone cone;
    cone.position = position;
    cone.direction = glm::vec3(0.0f, 1.0f, 0.0f);
    cone.speed = speed;
    cone.spread = spread;
    cone.rate = rate;
    return cone;
}

} // namespace

const char* lifecyclePresetName(LifecyclePreset preset) {
    for (const PresetName& p : PRESET_NAMES) {
        if (p.preset == preset) return p.name;
    }
    return "none";
}

std::optional<LifecyclePreset> parseLifecyclePreset(const std::string& name) {
    for (const PresetName& p : PRESET_NAMES) {
        if (name == p.name) return p.preset;
    }
    return std::nullopt;
}

// =============================================================================
// Presets
// =============================================================================

Lifecycle Lifecycle::fire(const glm::vec3& position, float rate) {
    Lifecycle l;
    l.lifetime(1.5f)
     .fadeOut()
     .shrinkOut()
     .colorOverLife(glm::vec3(1.0f, 0.9f, 0.3f), glm::vec3(0.8f, 0.2f, 0.0f))
     .emitter(upwardCone(position, 0.8f, 0.4f, rate))
     .startDead();
    return l;
}

Lifecycle Lifecycle::fountain(const glm::vec3& position, float rate) {
    Lifecycle l;
    l.lifetime(3.0f)
     .fadeOut()
     .colorOverLife(glm::vec3(0.7f, 0.85f, 1.0f), glm::vec3(0.2f, 0.4f, 0.8f))
     .emitter(upwardCone(position, 2.5f, 0.2f, rate))
     .startDead();
    return l;
}

Lifecycle Lifecycle::explosion(const glm::vec3& position, uint32_t count) {
    emitters::Burst burst;
    burst.position = position;
    burst.count = count;
    burst.speed = 3.0f;

    Lifecycle l;
    l.lifetime(1.2f)
     .fadeOut()
     .shrinkOut()
     .colorOverLife(glm::vec3(1.0f, 1.0f, 0.8f), glm::vec3(1.0f, 0.3f, 0.0f))
     .emitter(burst)
     .startDead();
    return l;
}

Lifecycle Lifecycle::smoke(const glm::vec3& position, float rate) {
    Lifecycle l;
    l.lifetime(4.0f)
     .fadeOut()
     .colorOverLife(glm::vec3(0.4f), glm::vec3(0.15f))
     .emitter(upwardCone(position, 0.3f, 0.6f, rate))
     .startDead();
    return l;
}

Lifecycle Lifecycle::sparkler(const glm::vec3& position, float rate) {
    emitters::Sphere sphere;
    sphere.center = position;
    sphere.radius = 0.02f;
    sphere.speed = 2.0f;
    sphere.rate = rate;

    Lifecycle l;
    l.lifetime(0.5f)
     .fadeOut()
     .shrinkOut()
     .colorOverLife(glm::vec3(1.0f), glm::vec3(1.0f, 0.6f, 0.1f))
     .emitter(sphere)
     .startDead();
    return l;
}

Lifecycle Lifecycle::rain(float rate) {
    emitters::Box box;
    box.min = glm::vec3(-1.0f, 0.9f, -1.0f);
    box.max = glm::vec3(1.0f, 1.0f, 1.0f);
    box.velocity = glm::vec3(0.0f, -2.0f, 0.0f);
    box.rate = rate;

    Lifecycle l;
    l.lifetime(2.0f)
     .colorOverLife(glm::vec3(0.6f, 0.7f, 0.9f), glm::vec3(0.4f, 0.5f, 0.7f))
     .emitter(box)
     .startDead();
    return l;
}

Lifecycle Lifecycle::preset(LifecyclePreset preset, const glm::vec3& position, float rate) {
    switch (preset) {
        case LifecyclePreset::Fire: return fire(position, rate);
        case LifecyclePreset::Fountain: return fountain(position, rate);
        case LifecyclePreset::Explosion: return explosion(position, static_cast<uint32_t>(rate));
        case LifecyclePreset::Smoke: return smoke(position, rate);
        case LifecyclePreset::Sparkler: return sparkler(position, rate);
        case LifecyclePreset::Rain: return rain(rate);
        case LifecyclePreset::None: break;
    }
    return Lifecycle();
}

// =============================================================================
// Expansion
// =============================================================================

Lifecycle& Lifecycle::colorOverLife(const glm::vec3& start, const glm::vec3& end) {
    m_colorOverLife = std::make_pair(start, end);
    return *this;
}

bool Lifecycle::needsColor() const {
    return m_lifetime && (m_fadeOut || m_colorOverLife);
}

std::vector<Rule> Lifecycle::rules() const {
    std::vector<Rule> out;
    if (!m_lifetime && !m_fadeOut && !m_shrinkOut && !m_colorOverLife) {
        return out;
    }
    out.push_back(rules::Age{});
    if (!m_lifetime) {
        return out;
    }

    float duration = *m_lifetime;
    out.push_back(rules::Lifetime{duration});
    // Color over life assigns the color outright, so it runs before the fade
    if (m_colorOverLife) {
        out.push_back(rules::ColorOverLife{m_colorOverLife->first, m_colorOverLife->second, duration});
    }
    if (m_fadeOut) {
        out.push_back(rules::FadeOut{duration});
    }
    if (m_shrinkOut) {
        out.push_back(rules::ShrinkOut{duration});
    }
    return out;
}

} // namespace flux
