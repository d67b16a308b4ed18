#pragma once

#include "SnapRules.hpp"
#include "Tween.hpp"
#include "Types.hpp"

// Everything the controllers mutate for the current model.
// Owned by AnimationClock; other controllers hold a reference.
struct ViewerState {
    bool hasModel = false;
    Orientation orientation;
    SnapState snap;
    TweenAnimator tweens;
    float opacity = 1.0f;
};
