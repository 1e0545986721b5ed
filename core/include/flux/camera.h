#pragma once

/**
 * @file camera.h
 * @brief Orbit camera producing the view_proj uniform
 *
 * The camera orbits a center point at a distance with azimuth and elevation
 * angles (radians). Projection matrices use WebGPU's [0, 1] clip depth.
 */

#include <glm/glm.hpp>
#include <optional>

namespace flux {

enum class ProjectionMode {
    Perspective,
    Orthographic
};

struct Ray {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, -1.0f};  ///< Normalized

    /// @brief Hit point on the plane z = @p z; nullopt when parallel or behind the origin
    std::optional<glm::vec3> intersectPlaneZ(float z = 0.0f) const;
};

class Camera {
public:
    Camera();

    // -------------------------------------------------------------------------
    /// @name Orbit
    /// @{

    void orbit(const glm::vec3& center, float distance, float azimuth, float elevation);
    void orbit(float distance, float azimuth, float elevation);

    /// Add to the orbit angles (elevation stays clamped)
    void orbitBy(float deltaAzimuth, float deltaElevation);

    /// Scale the orbit distance
    void zoom(float factor);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Projection
    /// @{

    void fov(float degrees) { m_fov = degrees; }
    void nearPlane(float n) { m_near = n; }
    void farPlane(float f) { m_far = f; }
    void aspect(float a) { m_aspect = a; }
    void projectionMode(ProjectionMode mode) { m_mode = mode; }
    void orthoSize(float size) { m_orthoSize = size; }

    /// @}

    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;
    glm::mat4 viewProjectionMatrix() const;

    glm::vec3 position() const { return m_position; }
    glm::vec3 center() const { return m_center; }
    float distance() const { return m_distance; }
    float azimuth() const { return m_azimuth; }
    float elevation() const { return m_elevation; }
    float fovDegrees() const { return m_fov; }
    float aspectRatio() const { return m_aspect; }

    glm::vec3 forward() const;
    glm::vec3 right() const;

    /// @brief World-space ray through a point in normalized device coordinates
    Ray screenToRay(const glm::vec2& ndc) const;

private:
    void updatePosition();

    glm::vec3 m_center{0.0f};
    glm::vec3 m_position{0.0f, 0.0f, 3.0f};
    glm::vec3 m_up{0.0f, 1.0f, 0.0f};
    float m_distance = 3.0f;
    float m_azimuth = 0.0f;
    float m_elevation = 0.3f;
    float m_fov = 45.0f;
    float m_near = 0.1f;
    float m_far = 100.0f;
    float m_aspect = 16.0f / 9.0f;
    ProjectionMode m_mode = ProjectionMode::Perspective;
    float m_orthoSize = 4.0f;
};

} // namespace flux
