#pragma once

#include "Types.hpp"

#include <glm/glm.hpp>

// Rotation matrix for XYZ Euler angles (radians): X applied first, then Y, then Z.
glm::mat4 eulerXYZ(const glm::vec3& euler);

// Object world matrix: translation * rotation
glm::mat4 objectTransform(const glm::vec3& location, const glm::vec3& euler);

// 场景相机：位置 + 欧拉角，沿局部 -Z 观察，局部 +Y 为上方
class SceneCamera {
public:
    SceneCamera() = default;
    explicit SceneCamera(const CameraSpec& spec);

    glm::vec3 location = glm::vec3(0.0f);
    glm::vec3 rotationEuler = glm::vec3(0.0f);
    float horizontalFovDeg = 39.6f;
    float clipNear = 0.1f;
    float clipFar = 100.0f;

    glm::vec3 forward() const;
    glm::vec3 up() const;

    glm::mat4 world() const;
    glm::mat4 view() const;
    glm::mat4 projection(float aspect) const;

    // Vertical field of view matching the horizontal one at this aspect.
    float verticalFovRad(float aspect) const;
};
