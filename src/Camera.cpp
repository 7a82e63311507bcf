#include "Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

glm::mat4 eulerXYZ(const glm::vec3& euler) {
    glm::mat4 R(1.0f);
    R = glm::rotate(R, euler.z, glm::vec3(0.0f, 0.0f, 1.0f));
    R = glm::rotate(R, euler.y, glm::vec3(0.0f, 1.0f, 0.0f));
    R = glm::rotate(R, euler.x, glm::vec3(1.0f, 0.0f, 0.0f));
    return R;
}

glm::mat4 objectTransform(const glm::vec3& location, const glm::vec3& euler) {
    return glm::translate(glm::mat4(1.0f), location) * eulerXYZ(euler);
}

SceneCamera::SceneCamera(const CameraSpec& spec)
    : location(spec.location),
      rotationEuler(spec.rotationEuler),
      horizontalFovDeg(spec.horizontalFovDeg),
      clipNear(spec.clipNear),
      clipFar(spec.clipFar) {}

glm::vec3 SceneCamera::forward() const {
    return glm::normalize(glm::vec3(eulerXYZ(rotationEuler) * glm::vec4(0.0f, 0.0f, -1.0f, 0.0f)));
}

glm::vec3 SceneCamera::up() const {
    return glm::normalize(glm::vec3(eulerXYZ(rotationEuler) * glm::vec4(0.0f, 1.0f, 0.0f, 0.0f)));
}

glm::mat4 SceneCamera::world() const {
    return objectTransform(location, rotationEuler);
}

glm::mat4 SceneCamera::view() const {
    return glm::inverse(world());
}

float SceneCamera::verticalFovRad(float aspect) const {
    float h = glm::radians(horizontalFovDeg);
    if (aspect <= 0.0f) return h;
    // Sensor fits the wider side
    if (aspect >= 1.0f) return 2.0f * std::atan(std::tan(0.5f * h) / aspect);
    return h;
}

glm::mat4 SceneCamera::projection(float aspect) const {
    return glm::perspective(verticalFovRad(aspect), aspect, clipNear, clipFar);
}
