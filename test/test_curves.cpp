#include <gtest/gtest.h>
#include <marker_motion/curves.hpp>

using marker_motion::Curve;
namespace curves = marker_motion::curves;

constexpr double TOL = 1e-9;

// ============================================================================
// Test Suite: Curve_Endpoints
// ============================================================================

TEST(Curve_Endpoints, EveryPresetMapsZeroToZeroAndOneToOne) {
    for (const char* name : {"linear", "ease", "ease_in", "ease_out", "ease_in_out", "fast_out_slow_in", "decelerate"}) {
        const auto curve = curves::from_name(name);
        ASSERT_TRUE(curve.has_value()) << name;
        EXPECT_DOUBLE_EQ(curve->transform(0.0), 0.0) << name;
        EXPECT_DOUBLE_EQ(curve->transform(1.0), 1.0) << name;
    }
}

TEST(Curve_Endpoints, InputOutsideUnitIntervalIsClamped) {
    const Curve c = curves::ease_in();
    EXPECT_DOUBLE_EQ(c.transform(-0.5), 0.0);
    EXPECT_DOUBLE_EQ(c.transform(1.7), 1.0);
}

// ============================================================================
// Test Suite: Curve_Shape
// ============================================================================

TEST(Curve_Shape, LinearIsIdentity) {
    const Curve c = Curve::linear();
    EXPECT_TRUE(c.is_linear());
    EXPECT_NEAR(c.transform(0.25), 0.25, TOL);
    EXPECT_NEAR(c.transform(0.5), 0.5, TOL);
}

TEST(Curve_Shape, DefaultConstructedCurveIsLinear) {
    const Curve c;
    EXPECT_TRUE(c.is_linear());
    EXPECT_EQ(c.name(), "linear");
}

TEST(Curve_Shape, EaseInLagsBehindLinearAtMidpoint) {
    const double mid = curves::ease_in().transform(0.5);
    EXPECT_GT(mid, 0.0);
    EXPECT_LT(mid, 0.5);
    EXPECT_FALSE(curves::ease_in().is_linear());
}

TEST(Curve_Shape, EaseOutLeadsLinearAtMidpoint) {
    EXPECT_GT(curves::ease_out().transform(0.5), 0.5);
    EXPECT_GT(curves::decelerate().transform(0.5), 0.5);
}

TEST(Curve_Shape, PresetsAreMonotonic) {
    for (const char* name : {"ease", "ease_in", "ease_out", "ease_in_out", "fast_out_slow_in", "decelerate"}) {
        const Curve c = *curves::from_name(name);
        double previous = 0.0;
        for (int i = 1; i <= 100; ++i) {
            const double v = c.transform(i / 100.0);
            EXPECT_GE(v + 5e-3, previous) << name << " at " << i;
            previous = v;
        }
    }
}

TEST(Curve_Shape, CustomFunctionIsNotLinear) {
    const Curve c("square", [](double t) { return t * t; });
    EXPECT_FALSE(c.is_linear());
    EXPECT_NEAR(c.transform(0.5), 0.25, TOL);
    EXPECT_EQ(c.name(), "square");
}

TEST(Curve_Lookup, UnknownNameIsRejected) {
    EXPECT_FALSE(curves::from_name("bounce").has_value());
    EXPECT_FALSE(curves::from_name("").has_value());
}
