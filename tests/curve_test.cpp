#include "curve.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace anxious;

namespace {

Config make_config(double base, double max, double ramp) {
    Config c;
    c.base_sensitivity = base;
    c.max_sensitivity = max;
    c.ramp_rate = ramp;
    return c;
}

std::vector<Config> configs() {
    return {make_config(1.0, 15.0, 0.3), make_config(0.5, 5.0, 0.1), make_config(1.0, 30.0, 0.5),
            make_config(0.1, 0.2, 10.0), make_config(3.0, 300.0, 0.01)};
}

}  // namespace

TEST(CurveTest, ZeroVelocityGivesBase) {
    for (const auto& c : configs()) {
        CurveEvaluator curve(c);
        EXPECT_DOUBLE_EQ(curve.evaluate(0.0), c.base_sensitivity);
    }
}

TEST(CurveTest, NonDecreasingAndBounded) {
    for (const auto& c : configs()) {
        CurveEvaluator curve(c);
        double prev = curve.evaluate(0.0);
        for (double v = 0.25; v < 2000.0; v += 0.25) {
            double f = curve.evaluate(v);
            EXPECT_GE(f, prev) << "v=" << v;
            EXPECT_GE(f, c.base_sensitivity);
            EXPECT_LE(f, c.max_sensitivity);
            prev = f;
        }
    }
}

TEST(CurveTest, MidpointOfLogistic) {
    // 14 * e^(-0.3 v) == 1  =>  f(v) == max / 2
    CurveEvaluator curve(make_config(1.0, 15.0, 0.3));
    EXPECT_NEAR(curve.evaluate(std::log(14.0) / 0.3), 7.5, 1e-9);
}

TEST(CurveTest, ApproachesMaxForFastScrolling) {
    CurveEvaluator curve(make_config(1.0, 15.0, 0.3));
    EXPECT_NEAR(curve.evaluate(100.0), 15.0, 1e-9);
    EXPECT_LE(curve.evaluate(100.0), 15.0);
}

TEST(CurveTest, PathologicalInputsStayFinite) {
    CurveEvaluator curve(make_config(1.0, 15.0, 0.3));
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_DOUBLE_EQ(curve.evaluate(inf), curve.evaluate(1e300));
    EXPECT_TRUE(std::isfinite(curve.evaluate(inf)));
    EXPECT_LE(curve.evaluate(inf), 15.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(nan), 1.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(-50.0), 1.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(-inf), 1.0);
}
