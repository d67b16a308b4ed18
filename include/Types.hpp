#pragma once

#include <glm/glm.hpp>

#include <cstdint>

// 轴对齐包围盒
struct AABB {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
};

// Model orientation in radians.
// - yaw:   rotation about the vertical axis, unbounded
// - pitch: rotation about the horizontal axis, kept inside ClampConfig
struct Orientation {
    float yaw = 0.0f;
    float pitch = 0.0f;
};

// Inclusive pitch range, configured in degrees.
struct ClampConfig {
    float minDeg = -45.0f;
    float maxDeg = 110.0f;

    float minRad() const { return glm::radians(minDeg); }
    float maxRad() const { return glm::radians(maxDeg); }

    float clampPitch(float pitch) const {
        return glm::clamp(pitch, minRad(), maxRad());
    }
};

enum class Axis : uint8_t {
    Pitch,
    Yaw,
};

inline float& axisValue(Orientation& o, Axis axis) {
    return (axis == Axis::Pitch) ? o.pitch : o.yaw;
}

inline float axisValue(const Orientation& o, Axis axis) {
    return (axis == Axis::Pitch) ? o.pitch : o.yaw;
}
