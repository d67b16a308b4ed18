#include <gtest/gtest.h>
#include "AnimationClock.hpp"

#include "SnapRules.hpp"

#include <glm/gtc/constants.hpp>

#include <cmath>

namespace {

struct ClockFixture : ::testing::Test {
    double now = 0.0;
    AnimationClock clock{[this] { return now; }, ClampConfig{-45.0f, 110.0f}};
};

} // namespace

TEST_F(ClockFixture, NoModelTickLeavesStateAlone) {
    clock.state().tweens.spin.start(0.0f, 1.0f, 1.0, 0.0);
    now = 0.5;
    FrameState f = clock.tick();
    EXPECT_FALSE(f.hasModel);
    EXPECT_EQ(f.orientation.yaw, 0.0f);
    EXPECT_TRUE(clock.state().tweens.spin.active());
}

TEST_F(ClockFixture, IntroFadesInWhileSpinningOnce) {
    clock.state().orientation = Orientation{2.0f, 0.5f};
    clock.resetForModel(0.0);

    FrameState f = clock.tick();
    EXPECT_TRUE(f.hasModel);
    EXPECT_EQ(f.opacity, 0.0f);
    EXPECT_EQ(f.orientation.yaw, 0.0f);
    EXPECT_EQ(f.orientation.pitch, 0.0f);

    now = 0.75;
    f = clock.tick();
    EXPECT_NEAR(f.opacity, 0.5f, 1e-5f);
    EXPECT_GT(f.orientation.yaw, 0.0f);

    now = 1.5;
    f = clock.tick();
    EXPECT_EQ(f.opacity, 1.0f);
    EXPECT_FALSE(clock.state().tweens.fade.active());
    EXPECT_TRUE(clock.state().tweens.spin.active());

    now = 3.0;
    f = clock.tick();
    EXPECT_EQ(f.orientation.yaw, glm::two_pi<float>());
    EXPECT_FALSE(clock.state().tweens.anyActive());
}

TEST_F(ClockFixture, ResetWithoutIntroIsFullyOpaque) {
    clock.resetForModel(0.0, false);
    FrameState f = clock.tick();
    EXPECT_EQ(f.opacity, 1.0f);
    EXPECT_FALSE(clock.state().tweens.anyActive());
}

TEST_F(ClockFixture, ResetCancelsSnap) {
    clock.resetForModel(0.0, false);
    clock.state().snap.active = true;
    clock.resetForModel(1.0, false);
    EXPECT_FALSE(clock.state().snap.active);
}

TEST_F(ClockFixture, TiltTweenWritesAfterSnap) {
    clock.resetForModel(0.0, false);
    ViewerState& st = clock.state();
    st.orientation.pitch = glm::radians(30.0f);
    st.snap = SnapState{true, Axis::Pitch, glm::radians(90.0f), glm::radians(0.5f), 0.15f};
    st.tweens.tilt.start(0.0f, 0.0f, 1.0, 0.0);

    now = 0.5;
    FrameState f = clock.tick();
    EXPECT_EQ(f.orientation.pitch, 0.0f);
}

TEST_F(ClockFixture, TiltResultIsClamped) {
    clock.resetForModel(0.0, false);
    clock.state().tweens.tilt.start(0.0f, glm::radians(200.0f), 1.0, 0.0);

    for (int i = 0; i <= 60; ++i) {
        now = i / 60.0;
        FrameState f = clock.tick();
        EXPECT_LE(f.orientation.pitch, clock.clamp().maxRad());
    }
    EXPECT_EQ(clock.state().orientation.pitch, clock.clamp().maxRad());
}

TEST_F(ClockFixture, SnapConvergesMonotonicallyAndPins) {
    clock.resetForModel(0.0, false);
    ViewerState& st = clock.state();
    st.orientation.pitch = glm::radians(30.0f);
    st.snap = snap::evaluate(st.orientation.pitch, snap::defaultSettings());
    ASSERT_TRUE(st.snap.active);

    const float target = glm::radians(90.0f);
    float lastGap = std::abs(target - st.orientation.pitch);
    int frames = 0;
    while (st.snap.active && frames < 1000) {
        now += 1.0 / 60.0;
        FrameState f = clock.tick();
        float gap = std::abs(target - f.orientation.pitch);
        EXPECT_LE(gap, lastGap);
        lastGap = gap;
        ++frames;
    }
    EXPECT_FALSE(st.snap.active);
    EXPECT_EQ(st.orientation.pitch, target);
}

TEST_F(ClockFixture, ClearModelStopsEverything) {
    clock.resetForModel(0.0);
    clock.clearModel();
    EXPECT_FALSE(clock.state().hasModel);
    EXPECT_FALSE(clock.state().tweens.anyActive());
}
