#include "transform.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <cmath>
#include <vector>

using namespace anxious;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

Config with_base(double base) {
    Config c;
    c.base_sensitivity = base;
    return c;
}

}  // namespace

TEST(TransformTest, IsolatedTickIsBaseline) {
    TransformStage stage(Config{}, 1);
    EXPECT_EQ(stage.transform(1, seconds(10)), 1);
    EXPECT_EQ(stage.transform(1, seconds(12)), 1);
    EXPECT_DOUBLE_EQ(stage.last().multiplier, 1.0);
    EXPECT_TRUE(stage.last().restarted);
}

TEST(TransformTest, BurstAcceleratesBelowCeiling) {
    TransformStage stage(Config{}, 1);
    double prev_velocity = -1.0;
    int prev_output = 0;
    double ideal = 0.0;
    int emitted = 0;
    for (int i = 0; i < 5; ++i) {
        int out = stage.transform(1, milliseconds(500 + 10 * i));
        const Decision& d = stage.last();
        EXPECT_GT(d.velocity, prev_velocity);
        EXPECT_GE(out, prev_output);
        EXPECT_LE(out, 15);
        EXPECT_LT(d.multiplier, 15.0);
        prev_velocity = d.velocity;
        prev_output = out;
        ideal += d.multiplier;
        emitted += out;
    }
    EXPECT_GT(prev_output, 1);
    EXPECT_LT(std::fabs(emitted - ideal), 1.0);
}

TEST(TransformTest, OppositeTicksBothAtBase) {
    TransformStage stage(Config{}, 1);
    EXPECT_EQ(stage.transform(1, milliseconds(100)), 1);
    EXPECT_EQ(stage.transform(-1, milliseconds(110)), -1);
    EXPECT_DOUBLE_EQ(stage.last().velocity, 0.0);
    EXPECT_DOUBLE_EQ(stage.last().multiplier, 1.0);
}

TEST(TransformTest, CarryConservedAtFixedMultiplier) {
    // Ticks a second apart never accelerate, so the multiplier stays at base.
    const double m = 0.7;
    for (int sign : {1, -1}) {
        TransformStage stage(with_base(m), 1);
        std::vector<int> raw = {1, 1, 3, 1, 2, 5, 1, 1, 4, 2};
        long emitted = 0;
        long total_raw = 0;
        for (size_t i = 0; i < raw.size(); ++i) {
            emitted += stage.transform(sign * raw[i], seconds(i + 1));
            total_raw += sign * raw[i];
            EXPECT_DOUBLE_EQ(stage.last().multiplier, m);
            EXPECT_LT(std::fabs(emitted - m * total_raw), 1.0) << "after tick " << i;
        }
    }
}

TEST(TransformTest, SubUnitTicksAreDeferredNotLost) {
    TransformStage stage(with_base(0.4), 1);
    EXPECT_EQ(stage.transform(1, seconds(1)), 0);
    EXPECT_EQ(stage.transform(1, seconds(2)), 0);
    EXPECT_NEAR(stage.carry(), 0.8, 1e-12);
    EXPECT_EQ(stage.transform(1, seconds(3)), 1);
    EXPECT_NEAR(stage.carry(), 0.2, 1e-12);
}

TEST(TransformTest, ReversalDropsCarry) {
    TransformStage stage(with_base(0.7), 1);
    EXPECT_EQ(stage.transform(1, seconds(1)), 0);
    EXPECT_NEAR(stage.carry(), 0.7, 1e-12);
    EXPECT_EQ(stage.transform(-1, seconds(1) + milliseconds(10)), 0);
    EXPECT_NEAR(stage.carry(), -0.7, 1e-12);
}

TEST(TransformTest, IdleGapKeepsCarry) {
    TransformStage stage(with_base(0.7), 1);
    stage.transform(1, seconds(1));
    EXPECT_EQ(stage.transform(1, seconds(5)), 1);
    EXPECT_NEAR(stage.carry(), 0.4, 1e-12);
}

TEST(TransformTest, HighResolutionDeltaIsOneLargerEvent) {
    TransformStage stage(Config{}, HI_RES_PER_NOTCH);
    EXPECT_EQ(stage.transform(120, milliseconds(1000)), 120);
    int out = stage.transform(120, milliseconds(1010));
    EXPECT_GT(out, 120);
    EXPECT_LE(out, 15 * 120);
    // Same velocity as a legacy device scrolling one detent per 10ms.
    TransformStage legacy(Config{}, 1);
    legacy.transform(1, milliseconds(1000));
    legacy.transform(1, milliseconds(1010));
    EXPECT_NEAR(stage.last().velocity, legacy.last().velocity, 1e-9);
}

TEST(TransformTest, ExtremeDeltaSaturates) {
    TransformStage stage(Config{}, 1);
    stage.transform(INT_MAX, milliseconds(1000));
    int out = stage.transform(INT_MAX, milliseconds(1000));
    EXPECT_EQ(out, INT_MAX);
    EXPECT_TRUE(std::isfinite(stage.carry()));
    EXPECT_LT(std::fabs(stage.carry()), 1.0);
}

TEST(TransformTest, ResetStartsNewGesture) {
    TransformStage stage(with_base(0.5), 1);
    stage.transform(1, milliseconds(0));
    stage.transform(1, milliseconds(10));
    stage.reset();
    EXPECT_DOUBLE_EQ(stage.carry(), 0.0);
    stage.transform(1, milliseconds(20));
    EXPECT_DOUBLE_EQ(stage.last().velocity, 0.0);
}
