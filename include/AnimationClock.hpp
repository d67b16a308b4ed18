#pragma once

#include "Types.hpp"
#include "ViewerState.hpp"

#include <functional>

// Values handed to the renderer each frame.
struct FrameState {
    bool hasModel = false;
    Orientation orientation;
    float opacity = 1.0f;
};

// Per-frame orchestrator. The host calls tick() once per rendered frame.
class AnimationClock {
public:
    using TimeSource = std::function<double()>; // seconds

    AnimationClock(TimeSource time, ClampConfig clamp);

    double now() const { return m_time(); }

    // Reads the time source, then advances.
    FrameState tick();

    // Snap convergence first, then fade/spin/tilt tweens.
    FrameState tick(double now);

    // A new model became current: orientation {0,0}, snap and tweens cleared.
    // With playIntro the model fades in while spinning once.
    void resetForModel(double now, bool playIntro = true);

    void clearModel();

    ViewerState& state() { return m_state; }
    const ViewerState& state() const { return m_state; }
    const ClampConfig& clamp() const { return m_clamp; }

private:
    TimeSource m_time;
    ClampConfig m_clamp;
    ViewerState m_state;

    FrameState snapshot() const;
};
