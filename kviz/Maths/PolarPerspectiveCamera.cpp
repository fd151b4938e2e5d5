#include "PolarPerspectiveCamera.hpp"

#include "kviz/Maths/AABB.hpp"
#include "kviz/Maths/Constants.hpp"

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace
{
    glm::vec3 PolarToCartesian(glm::vec3 focus, float radius, float theta, float phi)
    {
        float x = radius * std::sin(theta) * std::cos(phi);
        float y = radius * std::sin(phi);
        float z = radius * std::cos(theta) * std::cos(phi);

        return -focus + glm::vec3{x, y, z};
    }

    // a scene with no extent (e.g. a single point) still needs a usable camera distance
    constexpr float c_MinimumAutoFocusRadius = 0.1f;
}

kviz::PolarPerspectiveCamera::PolarPerspectiveCamera() :
    radius{1.0f},
    theta{0.0f},
    phi{0.0f},
    focusPoint{0.0f, 0.0f, 0.0f},
    fov{glm::radians(60.0f)},
    znear{0.1f},
    zfar{100.0f}
{
}

void kviz::PolarPerspectiveCamera::reset()
{
    *this = {};
}

void kviz::PolarPerspectiveCamera::pan(float aspectRatio, glm::vec2 delta) noexcept
{
    // how much panning is done depends on how far the camera is from the
    // origin (easy, with polar coordinates) *and* the FoV of the camera.
    float xAmt = delta.x * aspectRatio * (2.0f * std::tan(fov / 2.0f) * radius);
    float yAmt = -delta.y * (1.0f / aspectRatio) * (2.0f * std::tan(fov / 2.0f) * radius);

    // this assumes the scene is not rotated, so we need to rotate these
    // axes to match the scene's rotation
    glm::vec4 defaultPanningAx = {xAmt, yAmt, 0.0f, 1.0f};
    auto rotTheta = glm::rotate(glm::mat4{1.0f}, theta, glm::vec3{0.0f, 1.0f, 0.0f});
    auto thetaVec = glm::normalize(glm::vec3{std::sin(theta), 0.0f, std::cos(theta)});
    auto phiAxis = glm::cross(thetaVec, glm::vec3{0.0, 1.0f, 0.0f});
    auto rotPhi = glm::rotate(glm::mat4{1.0f}, phi, phiAxis);

    glm::vec4 panningAxes = rotPhi * rotTheta * defaultPanningAx;
    focusPoint.x += panningAxes.x;
    focusPoint.y += panningAxes.y;
    focusPoint.z += panningAxes.z;
}

void kviz::PolarPerspectiveCamera::drag(glm::vec2 delta) noexcept
{
    theta += 2.0f * fpi * -delta.x;
    phi += 2.0f * fpi * delta.y;
}

void kviz::PolarPerspectiveCamera::rescaleZNearAndZFarBasedOnRadius() noexcept
{
    // znear and zfar are only really dicated by the camera's radius, because
    // the radius is effectively the distance from the camera's focal point

    znear = 0.02f * radius;
    zfar = 20.0f * radius;
}

glm::mat4 kviz::PolarPerspectiveCamera::getViewMtx() const noexcept
{
    // camera: at a fixed position pointing at a fixed origin. The "camera"
    // works by translating + rotating all objects around that origin. Rotation
    // is expressed as polar coordinates. Camera panning is represented as a
    // translation vector.

    auto rotTheta = glm::rotate(glm::mat4{1.0f}, -theta, glm::vec3{0.0f, 1.0f, 0.0f});
    auto thetaVec = glm::normalize(glm::vec3{std::sin(theta), 0.0f, std::cos(theta)});
    auto phiAxis = glm::cross(thetaVec, glm::vec3{0.0, 1.0f, 0.0f});
    auto rotPhi = glm::rotate(glm::mat4{1.0f}, -phi, phiAxis);
    auto panTranslate = glm::translate(glm::mat4{1.0f}, focusPoint);
    return glm::lookAt(
        glm::vec3(0.0f, 0.0f, radius),
        glm::vec3(0.0f, 0.0f, 0.0f),
        glm::vec3{0.0f, 1.0f, 0.0f}) * rotTheta * rotPhi * panTranslate;
}

glm::mat4 kviz::PolarPerspectiveCamera::getProjMtx(float aspectRatio) const noexcept
{
    return glm::perspective(fov, aspectRatio, znear, zfar);
}

glm::vec3 kviz::PolarPerspectiveCamera::getPos() const noexcept
{
    return PolarToCartesian(focusPoint, radius, theta, phi);
}

bool kviz::operator==(PolarPerspectiveCamera const& a, PolarPerspectiveCamera const& b) noexcept
{
    return
        a.radius == b.radius &&
        a.theta == b.theta &&
        a.phi == b.phi &&
        a.focusPoint == b.focusPoint &&
        a.fov == b.fov &&
        a.znear == b.znear &&
        a.zfar == b.zfar;
}

bool kviz::operator!=(PolarPerspectiveCamera const& a, PolarPerspectiveCamera const& b) noexcept
{
    return !(a == b);
}

void kviz::ZoomIn(PolarPerspectiveCamera& camera)
{
    camera.radius *= 0.8f;
}

void kviz::ZoomOut(PolarPerspectiveCamera& camera)
{
    camera.radius *= 1.2f;
}

void kviz::AutoFocus(PolarPerspectiveCamera& camera, AABB const& elementAABB)
{
    camera.focusPoint = -Midpoint(elementAABB);
    camera.radius = std::max(2.0f * LongestDim(elementAABB), c_MinimumAutoFocusRadius);
    camera.theta = fpi4;
    camera.phi = fpi4;
    camera.rescaleZNearAndZFarBasedOnRadius();
}
