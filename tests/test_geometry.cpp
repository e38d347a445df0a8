#include <gtest/gtest.h>

#include "formcheck/pose/Geometry.h"
#include "test_helpers.hpp"

#include <cmath>
#include <random>

using namespace formcheck;
using formcheck::testing_util::lm;

namespace {

GeometryOptions cartesian() {
    GeometryOptions g;
    g.frame = CoordinateFrame::CARTESIAN;
    return g;
}

} // namespace

TEST(GeometryAngle, RightAngle) {
    Measurement m = angle(lm(1, 0), lm(0, 0), lm(0, 1), cartesian());
    ASSERT_TRUE(m.ok());
    EXPECT_NEAR(m.value, 90.f, 1e-4f);
}

TEST(GeometryAngle, CollinearGivesZeroAndStraight) {
    Measurement straight = angle(lm(-1, 0), lm(0, 0), lm(2, 0), cartesian());
    Measurement folded = angle(lm(1, 0), lm(0, 0), lm(3, 0), cartesian());
    ASSERT_TRUE(straight.ok());
    ASSERT_TRUE(folded.ok());
    EXPECT_NEAR(straight.value, 180.f, 1e-4f);
    EXPECT_NEAR(folded.value, 0.f, 1e-4f);
}

TEST(GeometryAngle, RangeAndSymmetryOverRandomTriples) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> coord(-100.f, 100.f);
    GeometryOptions g = cartesian();

    for (int i = 0; i < 500; ++i) {
        Landmark a = lm(coord(rng), coord(rng));
        Landmark b = lm(coord(rng), coord(rng));
        Landmark c = lm(coord(rng), coord(rng));
        Measurement abc = angle(a, b, c, g);
        Measurement cba = angle(c, b, a, g);
        ASSERT_TRUE(abc.ok());
        ASSERT_TRUE(cba.ok());
        EXPECT_GE(abc.value, 0.f);
        EXPECT_LE(abc.value, 180.f);
        EXPECT_FLOAT_EQ(abc.value, cba.value);
    }
}

TEST(GeometryAngle, SmallPerturbationGivesSmallChange) {
    GeometryOptions g = cartesian();
    Measurement base = angle(lm(1.f, 0.f), lm(0.f, 0.f), lm(0.5f, 0.8f), g);
    Measurement moved = angle(lm(1.f, 1e-3f), lm(1e-3f, 0.f), lm(0.5f, 0.801f), g);
    ASSERT_TRUE(base.ok());
    ASSERT_TRUE(moved.ok());
    EXPECT_LT(std::abs(base.value - moved.value), 0.5f);

    // near the straight configuration as well
    Measurement flat = angle(lm(-1.f, 0.f), lm(0.f, 0.f), lm(1.f, 0.f), g);
    Measurement flat_moved = angle(lm(-1.f, 0.f), lm(0.f, 0.f), lm(1.f, 1e-3f), g);
    EXPECT_LT(std::abs(flat.value - flat_moved.value), 0.5f);
}

TEST(GeometryAngle, CoincidentPointsAreDegenerate) {
    Measurement m = angle(lm(0, 0), lm(0, 0), lm(1, 1), cartesian());
    EXPECT_EQ(m.status, MeasureStatus::DEGENERATE);
    EXPECT_FALSE(m.ok());
}

TEST(GeometryAngle, LowVisibilityIsInsufficientConfidence) {
    Measurement m = angle(lm(1, 0), lm(0, 0, 0.1f), lm(0, 1), cartesian());
    EXPECT_EQ(m.status, MeasureStatus::INSUFFICIENT_CONFIDENCE);
}

TEST(GeometryAngle, ConfidenceCheckedBeforeDegeneracy) {
    Measurement m = angle(lm(0, 0, 0.f), lm(0, 0), lm(1, 1), cartesian());
    EXPECT_EQ(m.status, MeasureStatus::INSUFFICIENT_CONFIDENCE);
}

TEST(GeometryOffset, VerticalOffsetFollowsCoordinateFrame) {
    GeometryOptions img;   // IMAGE: y grows downward
    Measurement up_img = verticalOffset(lm(0, 10), lm(0, 50), img);
    Measurement up_cart = verticalOffset(lm(0, 50), lm(0, 10), cartesian());
    ASSERT_TRUE(up_img.ok());
    ASSERT_TRUE(up_cart.ok());
    EXPECT_FLOAT_EQ(up_img.value, 40.f);
    EXPECT_FLOAT_EQ(up_cart.value, 40.f);
}

TEST(GeometryOffset, HorizontalOffsetIsSigned) {
    Measurement m = horizontalOffset(lm(2, 0), lm(5, 0), cartesian());
    ASSERT_TRUE(m.ok());
    EXPECT_FLOAT_EQ(m.value, -3.f);
}

TEST(GeometryLevel, IsLevelWithinTolerance) {
    GeometryOptions g = cartesian();
    Check level = isLevel(lm(0, 0), lm(10, 0.5f), 10.f, g);
    Check tilted = isLevel(lm(0, 0), lm(10, 5.f), 10.f, g);
    ASSERT_TRUE(level.ok());
    ASSERT_TRUE(tilted.ok());
    EXPECT_TRUE(level.holds);
    EXPECT_FALSE(tilted.holds);
    EXPECT_NEAR(tilted.value, 26.565f, 1e-2f);
}

TEST(GeometryLevel, DirectionDoesNotMatter) {
    GeometryOptions g = cartesian();
    Measurement a = tiltDegrees(lm(0, 0), lm(10, 2), g);
    Measurement b = tiltDegrees(lm(10, 2), lm(0, 0), g);
    Measurement c = tiltDegrees(lm(0, 0), lm(-10, 2), g);
    EXPECT_FLOAT_EQ(a.value, b.value);
    EXPECT_FLOAT_EQ(a.value, c.value);
}

TEST(GeometryLevel, CoincidentPairIsDegenerate) {
    Check c = isLevel(lm(3, 3), lm(3, 3), 10.f, cartesian());
    EXPECT_EQ(c.status, MeasureStatus::DEGENERATE);
}

TEST(GeometryNearBody, PerpendicularDistanceToTorsoLine) {
    GeometryOptions g = cartesian();
    // vertical torso line x = 0
    Check close = nearBody(lm(0.2f, -1), lm(0, 0), lm(0, -3), 0.5f, g);
    Check swinging = nearBody(lm(1.5f, -1), lm(0, 0), lm(0, -3), 0.5f, g);
    ASSERT_TRUE(close.ok());
    ASSERT_TRUE(swinging.ok());
    EXPECT_TRUE(close.holds);
    EXPECT_NEAR(close.value, 0.2f, 1e-5f);
    EXPECT_FALSE(swinging.holds);
    EXPECT_NEAR(swinging.value, 1.5f, 1e-5f);
}

TEST(GeometryNearBody, ZeroLengthLineIsDegenerate) {
    Check c = nearBody(lm(1, 1), lm(0, 0), lm(0, 0), 1.f, cartesian());
    EXPECT_EQ(c.status, MeasureStatus::DEGENERATE);
}

TEST(GeometryMidpoint, AveragesPositionAndTakesMinVisibility) {
    Landmark m = midpoint(lm(0, 0, 0.9f), lm(2, 4, 0.3f));
    EXPECT_FLOAT_EQ(m.pos.x, 1.f);
    EXPECT_FLOAT_EQ(m.pos.y, 2.f);
    EXPECT_FLOAT_EQ(m.visibility, 0.3f);
}
