/**
 * @file test_hue.cpp
 * @brief Unit tests for Color/Hue
 *
 * Tests cover:
 * - Degree round trip over [0, 360]
 * - Rejection of out-of-range and NaN input (throwing and optional variants)
 * - Internal radian range and continuity across the 0/360 seam
 * - Normalizing construction: FromRadians, Rotated
 */

#include <gtest/gtest.h>
#include <Chroma/Color/Hue.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

using namespace Chroma;
using namespace Chroma::Color;

namespace {

/// Angular distance in degrees, accounting for wraparound
float AngleDistance(float a, float b) {
    float diff = std::fmod(std::abs(a - b), 360.0f);
    return std::min(diff, 360.0f - diff);
}

} // namespace

// =============================================================================
// FromDegrees / ToDegrees
// =============================================================================

TEST(HueTest, DefaultIsZero) {
    EXPECT_FLOAT_EQ(Hue().ToDegrees(), 0.0f);
    EXPECT_FLOAT_EQ(Hue().ToRadians(), 0.0f);
}

TEST(HueTest, RoundTripEveryTenthDegree) {
    for (int i = 0; i < 3600; ++i) {
        float degrees = static_cast<float>(i) / 10.0f;
        float back = Hue::FromDegrees(degrees).ToDegrees();
        EXPECT_GE(back, 0.0f);
        EXPECT_LT(back, 360.0f);
        EXPECT_LT(AngleDistance(back, degrees), 1e-3f) << "degrees=" << degrees;
    }
}

TEST(HueTest, KnownAngles) {
    EXPECT_NEAR(Hue::FromDegrees(40.0f).ToDegrees(), 40.0f, 1e-4f);
    EXPECT_NEAR(Hue::FromDegrees(180.0f).ToDegrees(), 180.0f, 1e-4f);
    EXPECT_NEAR(Hue::FromDegrees(270.0f).ToDegrees(), 270.0f, 1e-4f);
    EXPECT_NEAR(Hue::FromDegrees(359.5f).ToDegrees(), 359.5f, 1e-3f);
}

TEST(HueTest, FullTurnEqualsZero) {
    EXPECT_EQ(Hue::FromDegrees(360.0f), Hue::FromDegrees(0.0f));
    EXPECT_FLOAT_EQ(Hue::FromDegrees(360.0f).ToDegrees(), 0.0f);
}

TEST(HueTest, StoredRadiansStayInHalfOpenPiRange) {
    EXPECT_NEAR(Hue::FromDegrees(90.0f).ToRadians(), PI / 2.0f, 1e-6f);
    EXPECT_NEAR(Hue::FromDegrees(180.0f).ToRadians(), PI, 1e-6f);
    EXPECT_NEAR(Hue::FromDegrees(270.0f).ToRadians(), -PI / 2.0f, 1e-6f);
    EXPECT_LT(Hue::FromDegrees(359.0f).ToRadians(), 0.0f);
}

TEST(HueTest, TrigonometryContinuousAcrossSeam) {
    Hue below = Hue::FromDegrees(359.999f);
    Hue zero = Hue::FromDegrees(0.0f);
    Hue above = Hue::FromDegrees(0.001f);

    EXPECT_NEAR(std::cos(below.ToRadians()), std::cos(zero.ToRadians()), 1e-5f);
    EXPECT_NEAR(std::sin(below.ToRadians()), std::sin(zero.ToRadians()), 1e-4f);
    EXPECT_NEAR(std::sin(above.ToRadians()), std::sin(zero.ToRadians()), 1e-4f);
    EXPECT_NEAR(below.ToRadians(), zero.ToRadians(), 1e-4f);
}

// =============================================================================
// Rejection
// =============================================================================

TEST(HueTest, FromDegreesRejectsOutOfRange) {
    EXPECT_THROW(Hue::FromDegrees(-0.1f), OutOfRangeException);
    EXPECT_THROW(Hue::FromDegrees(360.1f), OutOfRangeException);
    EXPECT_THROW(Hue::FromDegrees(720.0f), OutOfRangeException);
    EXPECT_THROW(Hue::FromDegrees(std::numeric_limits<float>::infinity()), OutOfRangeException);
}

TEST(HueTest, FromDegreesRejectsNaN) {
    EXPECT_THROW(Hue::FromDegrees(std::numeric_limits<float>::quiet_NaN()),
                 InvalidArgumentException);
}

TEST(HueTest, TryFromDegrees) {
    ASSERT_TRUE(Hue::TryFromDegrees(120.0f).has_value());
    EXPECT_NEAR(Hue::TryFromDegrees(120.0f)->ToDegrees(), 120.0f, 1e-4f);
    EXPECT_TRUE(Hue::TryFromDegrees(0.0f).has_value());
    EXPECT_TRUE(Hue::TryFromDegrees(360.0f).has_value());

    EXPECT_FALSE(Hue::TryFromDegrees(-1.0f).has_value());
    EXPECT_FALSE(Hue::TryFromDegrees(361.0f).has_value());
    EXPECT_FALSE(Hue::TryFromDegrees(std::numeric_limits<float>::quiet_NaN()).has_value());
}

// =============================================================================
// Normalizing Construction
// =============================================================================

TEST(HueTest, FromRadiansWraps) {
    EXPECT_NEAR(Hue::FromRadians(PI / 2.0f).ToDegrees(), 90.0f, 1e-3f);
    EXPECT_NEAR(Hue::FromRadians(-PI / 2.0f).ToDegrees(), 270.0f, 1e-3f);
    EXPECT_NEAR(Hue::FromRadians(5.0f * PI / 2.0f).ToDegrees(), 90.0f, 1e-3f);
    EXPECT_NEAR(Hue::FromRadians(-PI).ToRadians(), PI, 1e-5f);
}

TEST(HueTest, FromRadiansRejectsNonFinite) {
    EXPECT_THROW(Hue::FromRadians(std::numeric_limits<float>::quiet_NaN()),
                 InvalidArgumentException);
    EXPECT_THROW(Hue::FromRadians(std::numeric_limits<float>::infinity()),
                 InvalidArgumentException);
}

TEST(HueTest, Rotated) {
    Hue hue = Hue::FromDegrees(350.0f);
    EXPECT_NEAR(hue.Rotated(20.0f).ToDegrees(), 10.0f, 1e-3f);
    // Landing on 0 may come back as a hair below 360
    EXPECT_LT(AngleDistance(hue.Rotated(-350.0f).ToDegrees(), 0.0f), 1e-3f);
    EXPECT_LT(AngleDistance(hue.Rotated(-710.0f).ToDegrees(), 0.0f), 1e-3f);
    EXPECT_NEAR(Hue::FromDegrees(10.0f).Rotated(-20.0f).ToDegrees(), 350.0f, 1e-3f);
}

// =============================================================================
// Comparison and Printing
// =============================================================================

TEST(HueTest, Ordering) {
    EXPECT_LT(Hue::FromDegrees(10.0f), Hue::FromDegrees(20.0f));
    EXPECT_NE(Hue::FromDegrees(10.0f), Hue::FromDegrees(20.0f));
    // Stored form orders hues above 180 before those below
    EXPECT_LT(Hue::FromDegrees(270.0f), Hue::FromDegrees(90.0f));
}

TEST(HueTest, StreamOutput) {
    std::ostringstream os;
    os << Hue::FromDegrees(90.0f);
    EXPECT_EQ(os.str().rfind("Hue(", 0), 0u);
}
