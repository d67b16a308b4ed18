#include "AnimationClock.hpp"

#include "Config.hpp"

#include <glm/gtc/constants.hpp>

#include <utility>

AnimationClock::AnimationClock(TimeSource time, ClampConfig clamp)
    : m_time(std::move(time)), m_clamp(clamp) {}

FrameState AnimationClock::tick() {
    return tick(now());
}

FrameState AnimationClock::tick(double now) {
    if (!m_state.hasModel) return snapshot();

    Orientation& o = m_state.orientation;

    // Snap runs first so a tween on the same frame writes last
    if (m_state.snap.active) {
        float& v = axisValue(o, m_state.snap.axis);
        v = snap::converge(m_state.snap, v, m_clamp);
    }

    TweenAnimator& tw = m_state.tweens;
    if (tw.fade.active()) {
        TweenSample s = tw.fade.tick(now);
        m_state.opacity = glm::clamp(s.value, 0.0f, 1.0f);
    }
    if (tw.spin.active()) {
        o.yaw = tw.spin.tick(now).value;
    }
    if (tw.tilt.active()) {
        o.pitch = m_clamp.clampPitch(tw.tilt.tick(now).value);
    }

    return snapshot();
}

void AnimationClock::resetForModel(double now, bool playIntro) {
    m_state.hasModel = true;
    m_state.orientation = Orientation{};
    m_state.snap.active = false;
    m_state.tweens.stopAll();
    m_state.opacity = 1.0f;

    if (playIntro) {
        m_state.opacity = 0.0f;
        m_state.tweens.fade.start(0.0f, 1.0f, cfg::INTRO_FADE_SECONDS, now);
        m_state.tweens.spin.start(0.0f, glm::two_pi<float>(), cfg::INTRO_SPIN_SECONDS, now);
    }
}

void AnimationClock::clearModel() {
    m_state.hasModel = false;
    m_state.snap.active = false;
    m_state.tweens.stopAll();
}

FrameState AnimationClock::snapshot() const {
    FrameState f;
    f.hasModel = m_state.hasModel;
    f.orientation = m_state.orientation;
    f.opacity = m_state.opacity;
    return f;
}
