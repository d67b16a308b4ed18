#include "SnapRules.hpp"

#include "Config.hpp"

#include <cmath>

namespace snap {

SnapSettings defaultSettings() {
    SnapSettings s;
    s.enabled = cfg::SNAP_ENABLED;
    s.axis = Axis::Pitch;
    s.rules = {
        {SnapPredicate::GreaterEqual, cfg::SNAP_FORWARD_THRESHOLD_DEG, cfg::SNAP_FORWARD_TARGET_DEG},
        {SnapPredicate::LessEqual, cfg::SNAP_UPRIGHT_THRESHOLD_DEG, cfg::SNAP_UPRIGHT_TARGET_DEG},
    };
    s.epsilonDeg = cfg::SNAP_EPSILON_DEG;
    s.approachRate = cfg::SNAP_APPROACH_RATE;
    return s;
}

bool matches(const SnapRule& rule, float angle) {
    const float threshold = glm::radians(rule.thresholdDeg);
    switch (rule.predicate) {
        case SnapPredicate::GreaterEqual:
            return angle >= threshold;
        case SnapPredicate::LessEqual:
            return angle <= threshold;
        case SnapPredicate::WithinEpsilonOf:
            return std::abs(angle - glm::radians(rule.targetDeg)) <= threshold;
    }
    return false;
}

SnapState evaluate(float angle, const SnapSettings& settings) {
    SnapState s;
    s.axis = settings.axis;
    s.epsilon = glm::radians(settings.epsilonDeg);
    s.approachRate = settings.approachRate;

    if (!settings.enabled) return s;

    for (const auto& rule : settings.rules) {
        if (matches(rule, angle)) {
            s.active = true;
            s.target = glm::radians(rule.targetDeg);
            return s;
        }
    }
    return s;
}

SnapState evaluate(float angle, const std::vector<SnapRule>& rules) {
    SnapSettings settings = defaultSettings();
    settings.enabled = true;
    settings.rules = rules;
    return evaluate(angle, settings);
}

float converge(SnapState& state, float angle, const ClampConfig& clamp) {
    if (!state.active) return angle;

    // A pitch target outside the clamp range would never be reached
    const float target = (state.axis == Axis::Pitch) ? clamp.clampPitch(state.target) : state.target;

    const float delta = target - angle;
    if (std::abs(delta) <= state.epsilon) {
        state.active = false;
        return target;
    }

    float next = angle + delta * state.approachRate;
    if (state.axis == Axis::Pitch) {
        next = clamp.clampPitch(next);
    }
    return next;
}

} // namespace snap
