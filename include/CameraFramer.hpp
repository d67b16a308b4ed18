#pragma once

#include "Types.hpp"

#include <glm/glm.hpp>

// Camera placement that fits a bounding box into the view.
struct FrameResult {
    float distance = 1.0f;
    float nearPlane = 0.01f;
    float farPlane = 2000.0f;
    glm::vec3 center{0.0f}; // model is moved by -center to sit at the origin
};

namespace framing {

// distance = maxDim / (2 tan(fov/2)) * padding, with a fixed fallback for point-like bounds.
FrameResult frame(const AABB& bounds, float fovRadians);

} // namespace framing
