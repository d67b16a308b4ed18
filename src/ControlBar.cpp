#include "ControlBar.hpp"

#include "Config.hpp"

ControlBar::ControlBar() {
    m_buttons = {
        {ModelAction::TurnLeft,    {}, glm::vec3(0.30f, 0.55f, 0.85f)},
        {ModelAction::TiltBack,    {}, glm::vec3(0.35f, 0.70f, 0.45f)},
        {ModelAction::TiltNeutral, {}, glm::vec3(0.60f, 0.60f, 0.62f)},
        {ModelAction::ResetView,   {}, glm::vec3(0.85f, 0.75f, 0.30f)},
        {ModelAction::Spin,        {}, glm::vec3(0.80f, 0.40f, 0.75f)},
        {ModelAction::TiltForward, {}, glm::vec3(0.35f, 0.70f, 0.45f)},
        {ModelAction::TurnRight,   {}, glm::vec3(0.30f, 0.55f, 0.85f)},
    };
}

void ControlBar::layout(int viewportW, int viewportH) {
    (void)viewportH;

    const float size = cfg::CONTROL_BUTTON_SIZE;
    const float gap = cfg::CONTROL_BUTTON_GAP;
    const float n = (float)m_buttons.size();
    const float total = n * size + (n - 1.0f) * gap;

    float x = ((float)viewportW - total) * 0.5f;
    for (auto& b : m_buttons) {
        b.rect = UiRect{x, cfg::CONTROL_BAR_MARGIN, size, size};
        x += size + gap;
    }
}

int ControlBar::indexAt(float x, float y) const {
    for (size_t i = 0; i < m_buttons.size(); ++i) {
        if (pointInRect(x, y, m_buttons[i].rect)) return (int)i;
    }
    return -1;
}

std::optional<ModelAction> ControlBar::hitTest(float x, float y) const {
    int i = indexAt(x, y);
    if (i < 0) return std::nullopt;
    return m_buttons[(size_t)i].action;
}
