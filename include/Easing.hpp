#pragma once

namespace anim {

// 三次缓入缓出：t ∈ [0,1]
inline float cubicInOut(float t) {
    if (t < 0.5f) {
        return 4.0f * t * t * t;
    }
    float f = -2.0f * t + 2.0f;
    return 1.0f - (f * f * f) / 2.0f;
}

} // namespace anim
