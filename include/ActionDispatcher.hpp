#pragma once

#include "AnimationClock.hpp"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

// Remote-control vocabulary (wire names are case-sensitive).
enum class ModelAction : uint8_t {
    ResetView,   // "reset-view"
    Spin,        // "spin"
    TurnLeft,    // "turn-left"
    TurnRight,   // "turn-right"
    TiltForward, // "tilt-forward"
    TiltBack,    // "tilt-back"
    TiltNeutral, // "tilt-neutral"
};

std::optional<ModelAction> parseAction(std::string_view name);
const char* actionName(ModelAction action);

// Maps named actions onto tweens/orientation of the current model.
// Actions arriving before the first model has loaded are held and replayed
// in arrival order once it is ready; later actions without a model are dropped.
class ActionDispatcher {
public:
    using ReframeFn = std::function<void()>;

    ActionDispatcher(AnimationClock& clock, ReframeFn reframe);

    void dispatch(std::string_view name);
    void dispatch(ModelAction action);

    // Called every time a model becomes current. Only the first call has
    // anything to flush.
    void onModelReady();

    // The startup load sequence has finished, successfully or not. If no model
    // came out of it the held actions are dropped, and so is anything that
    // arrives without a model from here on.
    void onLoadSequenceComplete();

    size_t pendingCount() const { return m_pending.size(); }
    bool firstModelSeen() const { return m_firstModelSeen; }
    bool loadSequenceComplete() const { return m_loadSequenceComplete; }

private:
    AnimationClock& m_clock;
    ReframeFn m_reframe;

    std::vector<ModelAction> m_pending;
    bool m_firstModelSeen = false;
    bool m_loadSequenceComplete = false;

    void apply(ModelAction action);
};
