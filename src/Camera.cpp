#include "Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

// 应用自动取景结果（距离与裁剪面）
void ViewCamera::apply(const FrameResult& f) {
    target = glm::vec3(0.0f);
    distance = f.distance;
    nearPlane = f.nearPlane;
    farPlane = f.farPlane;
}

glm::vec3 ViewCamera::position() const {
    return target + glm::vec3(0.0f, 0.0f, distance);
}

glm::mat4 ViewCamera::view() const {
    return glm::lookAt(position(), target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 ViewCamera::projection(float aspect) const {
    return glm::perspective(glm::radians(fovDeg), aspect, nearPlane, farPlane);
}
