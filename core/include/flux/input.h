#pragma once

/**
 * @file input.h
 * @brief Per-frame input snapshot handed to update callbacks
 *
 * InputTracker folds raw key and mouse events into state. Once per frame the
 * simulation takes a snapshot and then ends the frame, which clears the
 * "pressed this frame" latches. A key pressed and released between two
 * snapshots still reads as pressed in the next one.
 *
 * Key and button codes are GLFW codes; the tracker itself has no window
 * dependency.
 */

#include <flux/camera.h>
#include <glm/glm.hpp>
#include <array>
#include <optional>

namespace flux {

constexpr int MAX_KEYS = 512;
constexpr int MAX_MOUSE_BUTTONS = 8;

struct KeyState {
    bool pressed = false;   ///< Went down since the last frame
    bool held = false;
    bool released = false;  ///< Went up since the last frame
};

class InputSnapshot {
public:
    const KeyState& key(int code) const;
    bool keyHeld(int code) const { return key(code).held; }
    bool keyPressed(int code) const { return key(code).pressed; }

    const KeyState& mouseButton(int button) const;

    glm::vec2 mousePixels() const { return m_mousePixels; }

    /// Mouse in normalized device coordinates, +y up
    glm::vec2 mouseNdc() const { return m_mouseNdc; }

    glm::vec2 scroll() const { return m_scroll; }
    glm::vec2 viewport() const { return m_viewport; }

    /// Mouse projected onto the z = 0 plane through the active camera
    std::optional<glm::vec3> mouseWorld() const { return m_mouseWorld; }

private:
    friend class InputTracker;

    std::array<KeyState, MAX_KEYS> m_keys{};
    std::array<KeyState, MAX_MOUSE_BUTTONS> m_buttons{};
    glm::vec2 m_mousePixels{0.0f};
    glm::vec2 m_mouseNdc{0.0f};
    glm::vec2 m_scroll{0.0f};
    glm::vec2 m_viewport{1.0f};
    std::optional<glm::vec3> m_mouseWorld;
};

class InputTracker {
public:
    void keyEvent(int code, bool down);
    void mouseButtonEvent(int button, bool down);
    void mouseMove(float x, float y);
    void scrollEvent(float dx, float dy);
    void setViewport(float width, float height);

    /// @brief Current state, mouse projected through @p camera
    InputSnapshot snapshot(const Camera& camera) const;

    /// Clear per-frame latches and the scroll accumulator
    void endFrame();

    /// Pixel position to NDC for a viewport (+y up)
    static glm::vec2 toNdc(const glm::vec2& pixels, const glm::vec2& viewport);

private:
    InputSnapshot m_state;
};

} // namespace flux
