#pragma once

/**
 * @file lifecycle.h
 * @brief Particle lifecycle settings and ready-made presets
 *
 * A Lifecycle collects lifetime, fade, shrink and color-over-life settings
 * plus the emitters that feed it, and expands into rules. Presets cover the
 * usual effects; every preset starts with all slots dead so the emitters do
 * all the spawning.
 *
 * @par Example
 * @code
 * auto sim = SimulationBuilder()
 *     .particleCount(20000)
 *     .lifecycle(Lifecycle::fire(glm::vec3(0.0f, -0.5f, 0.0f), 1000.0f))
 *     .rule(rules::Gravity{-1.0f})
 *     .build(*gpu, &err);
 * @endcode
 */

#include <flux/emitter.h>
#include <flux/rules.h>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flux {

/// Named presets, as spelled in config files
enum class LifecyclePreset {
    None,
    Fire,
    Fountain,
    Explosion,
    Smoke,
    Sparkler,
    Rain
};

const char* lifecyclePresetName(LifecyclePreset preset);
std::optional<LifecyclePreset> parseLifecyclePreset(const std::string& name);

class Lifecycle {
public:
    Lifecycle() = default;

    static Lifecycle fire(const glm::vec3& position, float rate);
    static Lifecycle fountain(const glm::vec3& position, float rate);
    static Lifecycle explosion(const glm::vec3& position, uint32_t count);
    static Lifecycle smoke(const glm::vec3& position, float rate);
    static Lifecycle sparkler(const glm::vec3& position, float rate);
    static Lifecycle rain(float rate);

    /// @brief Preset by enum; None gives an empty lifecycle
    static Lifecycle preset(LifecyclePreset preset, const glm::vec3& position, float rate);

    Lifecycle& lifetime(float seconds) { m_lifetime = seconds; return *this; }
    Lifecycle& fadeOut(bool enable = true) { m_fadeOut = enable; return *this; }
    Lifecycle& shrinkOut(bool enable = true) { m_shrinkOut = enable; return *this; }
    Lifecycle& colorOverLife(const glm::vec3& start, const glm::vec3& end);
    Lifecycle& emitter(const Emitter& e) { m_emitters.push_back(e); return *this; }
    Lifecycle& startDead(bool enable = true) { m_startDead = enable; return *this; }

    std::optional<float> lifetime() const { return m_lifetime; }
    bool startsDead() const { return m_startDead; }
    const std::vector<Emitter>& emitters() const { return m_emitters; }

    /**
     * @brief Rules this lifecycle contributes
     *
     * Age comes first when anything is set. Lifetime, color over life,
     * fade and shrink follow, all using the lifetime as duration; without a
     * lifetime only Age is produced.
     */
    std::vector<Rule> rules() const;

    /// True if the lifecycle renders colors (needs a color field)
    bool needsColor() const;

private:
    std::optional<float> m_lifetime;
    bool m_fadeOut = false;
    bool m_shrinkOut = false;
    std::optional<std::pair<glm::vec3, glm::vec3>> m_colorOverLife;
    std::vector<Emitter> m_emitters;
    bool m_startDead = false;
};

} // namespace flux
