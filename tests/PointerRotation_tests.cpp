#include <gtest/gtest.h>
#include "PointerRotation.hpp"

#include <optional>
#include <random>

namespace {

// Records capture calls; release of a pointer that isn't captured throws,
// like a surface that already dropped the capture.
class FakeCapture : public PointerCapture {
public:
    int captures = 0;
    int releases = 0;
    std::optional<int> captured;

    void capture(int pointerId) override {
        ++captures;
        captured = pointerId;
    }
    void release(int pointerId) override {
        ++releases;
        if (captured != pointerId) throw PointerCaptureError("not captured");
        captured.reset();
    }
    bool isCaptured() const override { return captured.has_value(); }
};

struct PointerFixture : ::testing::Test {
    ViewerState state;
    ClampConfig clamp{-45.0f, 110.0f};
    FakeCapture capture;
    // One degree per pixel keeps the arithmetic readable
    PointerRotationController pointer{state, clamp, snap::defaultSettings(), capture, glm::radians(1.0f)};

    void SetUp() override { state.hasModel = true; }
};

} // namespace

TEST_F(PointerFixture, IgnoresPointerDownWithoutModel) {
    state.hasModel = false;
    EXPECT_FALSE(pointer.pointerDown(1, 0.0, 0.0));
    EXPECT_EQ(pointer.dragState(), DragState::Idle);
    EXPECT_EQ(capture.captures, 0);
}

TEST_F(PointerFixture, DragMapsDeltasToYawAndPitch) {
    ASSERT_TRUE(pointer.pointerDown(1, 100.0, 100.0));
    EXPECT_EQ(pointer.dragState(), DragState::Dragging);
    EXPECT_TRUE(capture.isCaptured());

    pointer.pointerMove(110.0, 105.0);
    EXPECT_NEAR(state.orientation.yaw, glm::radians(10.0f), 1e-5f);
    EXPECT_NEAR(state.orientation.pitch, glm::radians(5.0f), 1e-5f);

    pointer.pointerMove(120.0, 105.0);
    EXPECT_NEAR(state.orientation.yaw, glm::radians(20.0f), 1e-5f);
}

TEST_F(PointerFixture, MoveWhileIdleDoesNothing) {
    pointer.pointerMove(500.0, 500.0);
    EXPECT_EQ(state.orientation.yaw, 0.0f);
    EXPECT_EQ(state.orientation.pitch, 0.0f);
}

TEST_F(PointerFixture, PitchStaysInsideClampForAnyDrag) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> step(-400.0, 400.0);

    pointer.pointerDown(1, 0.0, 0.0);
    double x = 0.0, y = 0.0;
    for (int i = 0; i < 2000; ++i) {
        x += step(rng);
        y += step(rng);
        pointer.pointerMove(x, y);
        EXPECT_GE(state.orientation.pitch, clamp.minRad());
        EXPECT_LE(state.orientation.pitch, clamp.maxRad());
    }
}

TEST_F(PointerFixture, YawIsNotClamped) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(1000.0, 0.0);
    EXPECT_NEAR(state.orientation.yaw, glm::radians(1000.0f), 1e-3f);
}

TEST_F(PointerFixture, PointerDownCancelsActiveSnap) {
    state.snap.active = true;
    pointer.pointerDown(1, 0.0, 0.0);
    EXPECT_FALSE(state.snap.active);
}

TEST_F(PointerFixture, ReleaseAboveForwardThresholdActivatesSnap) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(0.0, 30.0);
    pointer.pointerUp(1);

    EXPECT_EQ(pointer.dragState(), DragState::Idle);
    EXPECT_FALSE(capture.isCaptured());
    ASSERT_TRUE(state.snap.active);
    EXPECT_EQ(state.snap.axis, Axis::Pitch);
    EXPECT_FLOAT_EQ(state.snap.target, glm::radians(90.0f));
}

TEST_F(PointerFixture, ReleaseBetweenThresholdsClearsSnap) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(0.0, 15.0);
    pointer.pointerUp(1);
    EXPECT_FALSE(state.snap.active);
}

TEST_F(PointerFixture, LeaveEndsDragAndEvaluatesSnap) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(0.0, 2.0);
    pointer.pointerLeave();

    EXPECT_EQ(pointer.dragState(), DragState::Idle);
    EXPECT_FALSE(capture.isCaptured());
    EXPECT_EQ(capture.releases, 1);
    ASSERT_TRUE(state.snap.active);
    EXPECT_FLOAT_EQ(state.snap.target, 0.0f);
}

TEST_F(PointerFixture, CancelBehavesLikeRelease) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(0.0, 40.0);
    pointer.pointerCancel(1);
    EXPECT_EQ(pointer.dragState(), DragState::Idle);
    EXPECT_FALSE(capture.isCaptured());
    EXPECT_TRUE(state.snap.active);
}

TEST_F(PointerFixture, ReleaseOfLostCaptureIsSwallowed) {
    pointer.pointerDown(1, 0.0, 0.0);
    capture.captured.reset(); // surface dropped the capture on its own

    EXPECT_NO_THROW(pointer.pointerUp(1));
    EXPECT_EQ(capture.releases, 1);
    EXPECT_EQ(pointer.dragState(), DragState::Idle);

    // A stray release with nothing captured is just as harmless
    EXPECT_NO_THROW(pointer.pointerUp(7));
}

TEST_F(PointerFixture, OtherPointerLiftingKeepsDrag) {
    pointer.pointerDown(1, 0.0, 0.0);
    pointer.pointerMove(0.0, 40.0);

    pointer.pointerUp(2);
    pointer.pointerCancel(3);
    EXPECT_EQ(pointer.dragState(), DragState::Dragging);
    EXPECT_TRUE(capture.isCaptured());
    EXPECT_EQ(capture.releases, 0);
    EXPECT_FALSE(state.snap.active);

    pointer.pointerMove(10.0, 40.0);
    EXPECT_NEAR(state.orientation.yaw, glm::radians(10.0f), 1e-5f);

    pointer.pointerUp(1);
    EXPECT_EQ(pointer.dragState(), DragState::Idle);
    EXPECT_FALSE(capture.isCaptured());
    EXPECT_TRUE(state.snap.active);
}

TEST_F(PointerFixture, IdleReleaseDoesNotReevaluateSnap) {
    state.orientation.pitch = glm::radians(60.0f);
    pointer.pointerUp(1);
    pointer.pointerLeave();
    EXPECT_FALSE(state.snap.active);
}
