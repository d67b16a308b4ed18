#include "Tween.hpp"

#include "Easing.hpp"

#include <algorithm>

void TweenChannel::start(float from, float to, double duration, double now) {
    m_active = true;
    m_start = now;
    m_duration = duration;
    m_from = from;
    m_to = to;
}

TweenSample TweenChannel::tick(double now) {
    if (!m_active) {
        return TweenSample{m_to, true};
    }

    double t = 1.0;
    if (m_duration > 0.0) {
        t = std::clamp((now - m_start) / m_duration, 0.0, 1.0);
    }

    if (t >= 1.0) {
        // Land exactly on the target, no eased residue
        m_active = false;
        return TweenSample{m_to, true};
    }

    float eased = anim::cubicInOut(static_cast<float>(t));
    return TweenSample{m_from + (m_to - m_from) * eased, false};
}
