#include <gtest/gtest.h>
#include "SnapRules.hpp"

#include <vector>

static float deg(float d) { return glm::radians(d); }

TEST(SnapRules, GreaterEqualMatchesAtThreshold) {
    SnapRule r{SnapPredicate::GreaterEqual, 25.0f, 90.0f};
    EXPECT_TRUE(snap::matches(r, deg(25.0f)));
    EXPECT_TRUE(snap::matches(r, deg(30.0f)));
    EXPECT_FALSE(snap::matches(r, deg(24.0f)));
}

TEST(SnapRules, LessEqualMatchesAtThreshold) {
    SnapRule r{SnapPredicate::LessEqual, 5.0f, 0.0f};
    EXPECT_TRUE(snap::matches(r, deg(5.0f)));
    EXPECT_TRUE(snap::matches(r, deg(-40.0f)));
    EXPECT_FALSE(snap::matches(r, deg(6.0f)));
}

TEST(SnapRules, WithinEpsilonOfMeasuresDistanceToTarget) {
    SnapRule r{SnapPredicate::WithinEpsilonOf, 10.0f, 45.0f};
    EXPECT_TRUE(snap::matches(r, deg(40.0f)));
    EXPECT_TRUE(snap::matches(r, deg(54.0f)));
    EXPECT_FALSE(snap::matches(r, deg(30.0f)));
}

TEST(SnapRules, FirstMatchingRuleWins) {
    // Both rules match 30deg; only the first may be chosen
    std::vector<SnapRule> rules = {
        {SnapPredicate::GreaterEqual, 20.0f, 90.0f},
        {SnapPredicate::GreaterEqual, 10.0f, 45.0f},
    };
    SnapState s = snap::evaluate(deg(30.0f), rules);
    ASSERT_TRUE(s.active);
    EXPECT_FLOAT_EQ(s.target, deg(90.0f));

    std::swap(rules[0], rules[1]);
    s = snap::evaluate(deg(30.0f), rules);
    ASSERT_TRUE(s.active);
    EXPECT_FLOAT_EQ(s.target, deg(45.0f));
}

TEST(SnapRules, NoMatchIsExplicitlyInactive) {
    SnapSettings settings = snap::defaultSettings();
    // Between the upright (<=5) and forward (>=25) thresholds
    SnapState s = snap::evaluate(deg(15.0f), settings);
    EXPECT_FALSE(s.active);
}

TEST(SnapRules, DisabledNeverActivates) {
    SnapSettings settings = snap::defaultSettings();
    settings.enabled = false;
    EXPECT_FALSE(snap::evaluate(deg(60.0f), settings).active);
}

TEST(SnapRules, DefaultRulesSnapForwardAndUpright) {
    SnapSettings settings = snap::defaultSettings();

    SnapState forward = snap::evaluate(deg(30.0f), settings);
    ASSERT_TRUE(forward.active);
    EXPECT_EQ(forward.axis, Axis::Pitch);
    EXPECT_FLOAT_EQ(forward.target, deg(90.0f));

    SnapState upright = snap::evaluate(deg(3.0f), settings);
    ASSERT_TRUE(upright.active);
    EXPECT_FLOAT_EQ(upright.target, 0.0f);
}

TEST(SnapRules, ConvergeApproachesThenPins) {
    ClampConfig clamp;
    SnapState s = snap::evaluate(deg(30.0f), snap::defaultSettings());
    ASSERT_TRUE(s.active);

    float angle = deg(30.0f);
    float lastGap = std::abs(angle - s.target);
    int steps = 0;
    while (s.active && steps < 500) {
        angle = snap::converge(s, angle, clamp);
        float gap = std::abs(angle - s.target);
        EXPECT_LE(gap, lastGap);
        lastGap = gap;
        ++steps;
    }
    EXPECT_FALSE(s.active);
    EXPECT_EQ(angle, deg(90.0f));
}

TEST(SnapRules, ConvergeInactiveLeavesAngle) {
    ClampConfig clamp;
    SnapState s;
    EXPECT_FLOAT_EQ(snap::converge(s, 0.3f, clamp), 0.3f);
}

TEST(SnapRules, ConvergeTargetOutsideClampStillTerminates) {
    ClampConfig clamp{-45.0f, 60.0f};
    SnapState s = snap::evaluate(deg(30.0f), snap::defaultSettings()); // target 90 > 60
    float angle = deg(30.0f);
    for (int i = 0; i < 500 && s.active; ++i) {
        angle = snap::converge(s, angle, clamp);
        EXPECT_LE(angle, clamp.maxRad());
    }
    EXPECT_FALSE(s.active);
    EXPECT_FLOAT_EQ(angle, clamp.maxRad());
}
