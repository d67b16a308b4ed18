#pragma once

#include "Types.hpp"

#include <cstdint>
#include <vector>

enum class SnapPredicate : uint8_t {
    GreaterEqual,    // angle >= threshold
    LessEqual,       // angle <= threshold
    WithinEpsilonOf, // |angle - target| <= threshold
};

struct SnapRule {
    SnapPredicate predicate = SnapPredicate::WithinEpsilonOf;
    float thresholdDeg = 0.0f;
    float targetDeg = 0.0f;
};

// Post-drag convergence toward a rule target.
struct SnapState {
    bool active = false;
    Axis axis = Axis::Pitch;
    float target = 0.0f;       // radians
    float epsilon = 0.0f;      // radians
    float approachRate = 0.0f; // (0,1)
};

struct SnapSettings {
    bool enabled = true;
    Axis axis = Axis::Pitch;
    std::vector<SnapRule> rules;
    float epsilonDeg = 0.5f;
    float approachRate = 0.15f;
};

namespace snap {

// Rules and tuning from Config.hpp.
SnapSettings defaultSettings();

bool matches(const SnapRule& rule, float angle);

// First matching rule wins. No match (or snapping disabled) yields an inactive state.
SnapState evaluate(float angle, const SnapSettings& settings);
SnapState evaluate(float angle, const std::vector<SnapRule>& rules);

// One convergence step. Returns the new angle; pins to the target and
// deactivates once inside epsilon. Pitch results are kept inside `clamp`.
float converge(SnapState& state, float angle, const ClampConfig& clamp);

} // namespace snap
