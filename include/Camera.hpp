#pragma once

#include "CameraFramer.hpp"

#include <glm/glm.hpp>

// 固定相机：正面朝向原点（沿 -Z 观察），模型自身旋转
class ViewCamera {
public:
    glm::vec3 target = glm::vec3(0.0f, 0.0f, 0.0f);
    float distance = 5.0f;
    float fovDeg = 60.0f;
    float nearPlane = 0.01f;
    float farPlane = 2000.0f;

    void apply(const FrameResult& f);

    glm::vec3 position() const;
    glm::mat4 view() const;
    glm::mat4 projection(float aspect) const;
};
