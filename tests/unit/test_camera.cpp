/**
 * @file test_camera.cpp
 * @brief Unit tests for the orbit camera
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flux/camera.h>
#include <glm/gtc/constants.hpp>

using namespace flux;
using Catch::Matchers::WithinAbs;

TEST_CASE("Camera orbit", "[camera]") {
    Camera camera;

    SECTION("defaults") {
        REQUIRE(camera.distance() == 3.0f);
        REQUIRE(camera.fovDegrees() == 45.0f);
        REQUIRE_THAT(camera.aspectRatio(), WithinAbs(16.0 / 9.0, 1e-6));
    }

    SECTION("azimuth 0 looks down -z") {
        camera.orbit(2.0f, 0.0f, 0.0f);
        REQUIRE_THAT(camera.position().z, WithinAbs(2.0, 1e-5));
        REQUIRE_THAT(camera.forward().z, WithinAbs(-1.0, 1e-5));
    }

    SECTION("quarter turn moves to +x") {
        camera.orbit(2.0f, glm::half_pi<float>(), 0.0f);
        REQUIRE_THAT(camera.position().x, WithinAbs(2.0, 1e-5));
        REQUIRE_THAT(camera.position().z, WithinAbs(0.0, 1e-5));
    }

    SECTION("elevation stays short of the poles") {
        camera.orbitBy(0.0f, 10.0f);
        REQUIRE(camera.elevation() < glm::half_pi<float>());
        REQUIRE(camera.position().y < camera.distance());
    }

    SECTION("zoom scales and clamps the distance") {
        camera.zoom(0.5f);
        REQUIRE_THAT(camera.distance(), WithinAbs(1.5, 1e-5));
        camera.zoom(0.0001f);
        REQUIRE(camera.distance() > 0.0f);
        camera.zoom(1e6f);
        REQUIRE(camera.distance() <= 50.0f);
    }
}

TEST_CASE("Camera projection", "[camera][projection]") {
    Camera camera;
    camera.orbit(3.0f, 0.0f, 0.0f);
    camera.aspect(1.0f);

    SECTION("center projects to the middle of clip space") {
        glm::vec4 clip = camera.viewProjectionMatrix() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        glm::vec3 ndc = glm::vec3(clip) / clip.w;
        REQUIRE_THAT(ndc.x, WithinAbs(0.0, 1e-5));
        REQUIRE_THAT(ndc.y, WithinAbs(0.0, 1e-5));
    }

    SECTION("depth uses the [0, 1] range") {
        glm::mat4 vp = camera.viewProjectionMatrix();
        glm::vec4 nearPoint = vp * glm::vec4(0.0f, 0.0f, 2.9f, 1.0f);
        glm::vec4 farPoint = vp * glm::vec4(0.0f, 0.0f, -50.0f, 1.0f);
        float nearDepth = nearPoint.z / nearPoint.w;
        float farDepth = farPoint.z / farPoint.w;
        REQUIRE(nearDepth >= 0.0f);
        REQUIRE(farDepth <= 1.0f);
        REQUIRE(nearDepth < farDepth);
    }

    SECTION("+x appears on the right") {
        glm::vec4 clip = camera.viewProjectionMatrix() * glm::vec4(0.5f, 0.0f, 0.0f, 1.0f);
        REQUIRE(clip.x / clip.w > 0.0f);
    }

    SECTION("screen rays start at the camera side") {
        Ray ray = camera.screenToRay(glm::vec2(0.0f));
        REQUIRE(ray.origin.z > 0.0f);
        REQUIRE_THAT(ray.direction.z, WithinAbs(-1.0, 1e-4));
        auto hit = ray.intersectPlaneZ(0.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->x, WithinAbs(0.0, 1e-4));
    }

    SECTION("rays parallel to the plane miss") {
        Ray ray;
        ray.direction = glm::vec3(1.0f, 0.0f, 0.0f);
        REQUIRE_FALSE(ray.intersectPlaneZ(0.0f).has_value());
    }
}
