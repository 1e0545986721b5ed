// Flux - Camera Implementation

#include <flux/camera.h>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace flux {

std::optional<glm::vec3> Ray::intersectPlaneZ(float z) const {
    if (std::abs(direction.z) < 1e-6f) {
        return std::nullopt;
    }
    float t = (z - origin.z) / direction.z;
    if (t < 0.0f) {
        return std::nullopt;
    }
    return origin + direction * t;
}

// =============================================================================
// Camera
// =============================================================================

Camera::Camera() {
    updatePosition();
}

void Camera::orbit(const glm::vec3& center, float distance, float azimuth, float elevation) {
    m_center = center;
    m_distance = distance;
    m_azimuth = azimuth;
    m_elevation = elevation;
    updatePosition();
}

void Camera::orbit(float distance, float azimuth, float elevation) {
    orbit(glm::vec3(0.0f), distance, azimuth, elevation);
}

void Camera::orbitBy(float deltaAzimuth, float deltaElevation) {
    m_azimuth += deltaAzimuth;
    m_elevation += deltaElevation;
    updatePosition();
}

void Camera::zoom(float factor) {
    m_distance = std::clamp(m_distance * factor, m_near * 2.0f, m_far * 0.5f);
    updatePosition();
}

void Camera::updatePosition() {
    // Keep away from the poles so lookAt has a usable up vector
    float limit = glm::half_pi<float>() * 0.99f;
    m_elevation = std::clamp(m_elevation, -limit, limit);

    float cosElev = std::cos(m_elevation);
    m_position = m_center + glm::vec3(
        m_distance * cosElev * std::sin(m_azimuth),
        m_distance * std::sin(m_elevation),
        m_distance * cosElev * std::cos(m_azimuth));
}

glm::mat4 Camera::viewMatrix() const {
    return glm::lookAt(m_position, m_center, m_up);
}

glm::mat4 Camera::projectionMatrix() const {
    if (m_mode == ProjectionMode::Orthographic) {
        float halfH = m_orthoSize * 0.5f;
        float halfW = halfH * m_aspect;
        return glm::orthoRH_ZO(-halfW, halfW, -halfH, halfH, m_near, m_far);
    }
    return glm::perspectiveRH_ZO(glm::radians(m_fov), m_aspect, m_near, m_far);
}

glm::mat4 Camera::viewProjectionMatrix() const {
    return projectionMatrix() * viewMatrix();
}

glm::vec3 Camera::forward() const {
    return glm::normalize(m_center - m_position);
}

glm::vec3 Camera::right() const {
    return glm::normalize(glm::cross(forward(), m_up));
}

Ray Camera::screenToRay(const glm::vec2& ndc) const {
    glm::mat4 inv = glm::inverse(viewProjectionMatrix());
    glm::vec4 nearPoint = inv * glm::vec4(ndc, 0.0f, 1.0f);
    glm::vec4 farPoint = inv * glm::vec4(ndc, 1.0f, 1.0f);
    nearPoint /= nearPoint.w;
    farPoint /= farPoint.w;

    Ray ray;
    ray.origin = glm::vec3(nearPoint);
    ray.direction = glm::normalize(glm::vec3(farPoint) - glm::vec3(nearPoint));
    return ray;
}

} // namespace flux
