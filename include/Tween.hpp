#pragma once

struct TweenSample {
    float value = 0.0f;
    bool finished = false;
};

// Eased scalar interpolation over a fixed wall-clock window.
// Starting again while active simply overwrites the running tween.
class TweenChannel {
public:
    void start(float from, float to, double duration, double now);
    TweenSample tick(double now);
    void stop() { m_active = false; }

    bool active() const { return m_active; }
    float from() const { return m_from; }
    float to() const { return m_to; }
    double startTime() const { return m_start; }
    double duration() const { return m_duration; }

private:
    bool m_active = false;
    double m_start = 0.0;
    double m_duration = 0.0;
    float m_from = 0.0f;
    float m_to = 0.0f;
};

// The three independent channels driven by the animation clock.
struct TweenAnimator {
    TweenChannel fade; // material opacity
    TweenChannel spin; // yaw
    TweenChannel tilt; // pitch

    void stopAll() {
        fade.stop();
        spin.stop();
        tilt.stop();
    }

    bool anyActive() const { return fade.active() || spin.active() || tilt.active(); }
};
