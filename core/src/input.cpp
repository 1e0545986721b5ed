// Flux - Input Implementation

#include <flux/input.h>
#include <algorithm>

namespace flux {

namespace {

const KeyState NO_KEY{};

void applyEdge(KeyState& state, bool down) {
    if (down && !state.held) {
        state.pressed = true;
    } else if (!down && state.held) {
        state.released = true;
    }
    state.held = down;
}

} // namespace

const KeyState& InputSnapshot::key(int code) const {
    if (code < 0 || code >= MAX_KEYS) return NO_KEY;
    return m_keys[code];
}

const KeyState& InputSnapshot::mouseButton(int button) const {
    if (button < 0 || button >= MAX_MOUSE_BUTTONS) return NO_KEY;
    return m_buttons[button];
}

// =============================================================================
// InputTracker
// =============================================================================

void InputTracker::keyEvent(int code, bool down) {
    if (code < 0 || code >= MAX_KEYS) return;
    applyEdge(m_state.m_keys[code], down);
}

void InputTracker::mouseButtonEvent(int button, bool down) {
    if (button < 0 || button >= MAX_MOUSE_BUTTONS) return;
    applyEdge(m_state.m_buttons[button], down);
}

void InputTracker::mouseMove(float x, float y) {
    m_state.m_mousePixels = glm::vec2(x, y);
    m_state.m_mouseNdc = toNdc(m_state.m_mousePixels, m_state.m_viewport);
}

void InputTracker::scrollEvent(float dx, float dy) {
    m_state.m_scroll += glm::vec2(dx, dy);
}

void InputTracker::setViewport(float width, float height) {
    m_state.m_viewport = glm::vec2(std::max(width, 1.0f), std::max(height, 1.0f));
    m_state.m_mouseNdc = toNdc(m_state.m_mousePixels, m_state.m_viewport);
}

InputSnapshot InputTracker::snapshot(const Camera& camera) const {
    InputSnapshot snap = m_state;
    snap.m_mouseWorld = camera.screenToRay(snap.m_mouseNdc).intersectPlaneZ(0.0f);
    return snap;
}

void InputTracker::endFrame() {
    for (KeyState& k : m_state.m_keys) {
        k.pressed = false;
        k.released = false;
    }
    for (KeyState& b : m_state.m_buttons) {
        b.pressed = false;
        b.released = false;
    }
    m_state.m_scroll = glm::vec2(0.0f);
}

glm::vec2 InputTracker::toNdc(const glm::vec2& pixels, const glm::vec2& viewport) {
    return glm::vec2(pixels.x / viewport.x * 2.0f - 1.0f,
                     1.0f - pixels.y / viewport.y * 2.0f);
}

} // namespace flux
