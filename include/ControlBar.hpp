#pragma once

#include "ActionDispatcher.hpp"

#include <glm/glm.hpp>

#include <optional>
#include <vector>

// Screen rectangle, origin bottom-left (GL convention).
struct UiRect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

inline bool pointInRect(float x, float y, const UiRect& r) {
    return x >= r.x && x <= (r.x + r.w) && y >= r.y && y <= (r.y + r.h);
}

// A clickable control tagged with the action it triggers.
struct ControlButton {
    ModelAction action;
    UiRect rect;
    glm::vec3 color;
};

// Row of action buttons centred along the bottom edge of the window.
class ControlBar {
public:
    ControlBar();

    void layout(int viewportW, int viewportH);

    // x/y in bottom-left screen space.
    std::optional<ModelAction> hitTest(float x, float y) const;
    int indexAt(float x, float y) const; // -1 if none

    const std::vector<ControlButton>& buttons() const { return m_buttons; }

private:
    std::vector<ControlButton> m_buttons;
};
