#include "ActionDispatcher.hpp"

#include "Config.hpp"
#include "Util.hpp"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace {

struct ActionEntry {
    ModelAction action;
    const char* name;
};

const std::array<ActionEntry, 7> kActions = {{
    {ModelAction::ResetView, "reset-view"},
    {ModelAction::Spin, "spin"},
    {ModelAction::TurnLeft, "turn-left"},
    {ModelAction::TurnRight, "turn-right"},
    {ModelAction::TiltForward, "tilt-forward"},
    {ModelAction::TiltBack, "tilt-back"},
    {ModelAction::TiltNeutral, "tilt-neutral"},
}};

} // namespace

std::optional<ModelAction> parseAction(std::string_view name) {
    for (const auto& e : kActions) {
        if (name == e.name) return e.action;
    }
    return std::nullopt;
}

const char* actionName(ModelAction action) {
    for (const auto& e : kActions) {
        if (e.action == action) return e.name;
    }
    return "unknown";
}

ActionDispatcher::ActionDispatcher(AnimationClock& clock, ReframeFn reframe)
    : m_clock(clock), m_reframe(std::move(reframe)) {}

void ActionDispatcher::dispatch(std::string_view name) {
    auto action = parseAction(name);
    if (!action) {
        // An explicit request still cancels a passive snap-back
        m_clock.state().snap.active = false;
        util::logWarn("Unknown model action: " + std::string(name));
        return;
    }
    dispatch(*action);
}

void ActionDispatcher::dispatch(ModelAction action) {
    ViewerState& st = m_clock.state();
    st.snap.active = false;

    if (!st.hasModel) {
        if (!m_firstModelSeen && !m_loadSequenceComplete) {
            util::logInfo(std::string("Model not ready, queued action: ") + actionName(action));
            m_pending.push_back(action);
        } else {
            util::logWarn(std::string("No model loaded, dropped action: ") + actionName(action));
        }
        return;
    }

    apply(action);
}

void ActionDispatcher::onModelReady() {
    if (m_firstModelSeen) return;
    m_firstModelSeen = true;

    std::vector<ModelAction> queued;
    queued.swap(m_pending);
    if (!queued.empty()) {
        util::logInfo("Replaying " + std::to_string(queued.size()) + " queued action(s)");
    }
    for (ModelAction a : queued) {
        dispatch(a);
    }
}

void ActionDispatcher::onLoadSequenceComplete() {
    m_loadSequenceComplete = true;
    if (m_firstModelSeen || m_pending.empty()) return;

    util::logWarn("No model loaded, dropped " + std::to_string(m_pending.size()) + " queued action(s)");
    m_pending.clear();
}

void ActionDispatcher::apply(ModelAction action) {
    ViewerState& st = m_clock.state();
    const ClampConfig& clamp = m_clock.clamp();
    const double now = m_clock.now();
    const float yaw = st.orientation.yaw;
    const float pitch = st.orientation.pitch;

    switch (action) {
        case ModelAction::ResetView:
            st.orientation = Orientation{};
            st.tweens.spin.stop();
            st.tweens.tilt.stop();
            if (m_reframe) m_reframe();
            break;
        case ModelAction::Spin:
            st.tweens.spin.start(yaw, yaw + glm::two_pi<float>(), cfg::SPIN_SECONDS, now);
            break;
        case ModelAction::TurnLeft:
            st.tweens.spin.start(yaw, yaw - glm::radians(cfg::TURN_DEG), cfg::TURN_SECONDS, now);
            break;
        case ModelAction::TurnRight:
            st.tweens.spin.start(yaw, yaw + glm::radians(cfg::TURN_DEG), cfg::TURN_SECONDS, now);
            break;
        case ModelAction::TiltForward:
            st.tweens.tilt.start(pitch, glm::radians(std::min(cfg::TILT_DEG, clamp.maxDeg)), cfg::TILT_SECONDS, now);
            break;
        case ModelAction::TiltBack:
            st.tweens.tilt.start(pitch, glm::radians(std::max(-cfg::TILT_DEG, clamp.minDeg)), cfg::TILT_SECONDS, now);
            break;
        case ModelAction::TiltNeutral:
            st.tweens.tilt.start(pitch, 0.0f, cfg::TILT_NEUTRAL_SECONDS, now);
            break;
    }
}
