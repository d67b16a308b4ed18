#include "CameraFramer.hpp"

#include "Config.hpp"

#include <algorithm>
#include <cmath>

namespace framing {

FrameResult frame(const AABB& bounds, float fovRadians) {
    glm::vec3 size = bounds.max - bounds.min;
    float maxDim = std::max(size.x, std::max(size.y, size.z));

    float distance = maxDim / (2.0f * std::tan(fovRadians / 2.0f));
    distance *= cfg::FRAME_PADDING;

    // Point-like or inverted bounds, or a fov that makes tan() blow up
    if (!(maxDim > 0.0f) || !std::isfinite(distance) || distance <= 0.0f) {
        distance = cfg::FRAME_FALLBACK_DISTANCE;
    }

    FrameResult r;
    r.distance = distance;
    r.nearPlane = std::max(distance / 1000.0f, cfg::FRAME_MIN_NEAR);
    r.farPlane = std::max(distance * 100.0f, cfg::FRAME_MIN_FAR);
    r.center = 0.5f * (bounds.min + bounds.max);
    return r;
}

} // namespace framing
