#include <gtest/gtest.h>
#include "ControlBar.hpp"

#include "Config.hpp"

#include <set>

TEST(ControlBarLayout, EveryActionHasOneButton) {
    ControlBar bar;
    std::set<ModelAction> seen;
    for (const auto& b : bar.buttons()) seen.insert(b.action);
    EXPECT_EQ(bar.buttons().size(), 7u);
    EXPECT_EQ(seen.size(), 7u);
}

TEST(ControlBarLayout, RowIsCentredAlongTheBottom) {
    ControlBar bar;
    bar.layout(1280, 720);
    const auto& b = bar.buttons();

    const float left = b.front().rect.x;
    const float right = b.back().rect.x + b.back().rect.w;
    EXPECT_FLOAT_EQ(left, 1280.0f - right);

    for (size_t i = 0; i < b.size(); ++i) {
        EXPECT_FLOAT_EQ(b[i].rect.y, cfg::CONTROL_BAR_MARGIN);
        EXPECT_FLOAT_EQ(b[i].rect.w, cfg::CONTROL_BUTTON_SIZE);
        if (i > 0) {
            EXPECT_FLOAT_EQ(b[i].rect.x - (b[i - 1].rect.x + b[i - 1].rect.w), cfg::CONTROL_BUTTON_GAP);
        }
    }
}

TEST(ControlBarHit, CentresMapToTheirActions) {
    ControlBar bar;
    bar.layout(800, 600);
    for (size_t i = 0; i < bar.buttons().size(); ++i) {
        const UiRect& r = bar.buttons()[i].rect;
        const float cx = r.x + r.w * 0.5f;
        const float cy = r.y + r.h * 0.5f;
        EXPECT_EQ(bar.indexAt(cx, cy), (int)i);
        auto a = bar.hitTest(cx, cy);
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(*a, bar.buttons()[i].action);
    }
}

TEST(ControlBarHit, MissesOutsideButtons) {
    ControlBar bar;
    bar.layout(800, 600);
    EXPECT_EQ(bar.indexAt(400.0f, 300.0f), -1);
    EXPECT_FALSE(bar.hitTest(1.0f, 1.0f).has_value());

    // Gap between the first two buttons
    const UiRect& r = bar.buttons()[0].rect;
    EXPECT_EQ(bar.indexAt(r.x + r.w + cfg::CONTROL_BUTTON_GAP * 0.5f, r.y + 1.0f), -1);
}
