/**
 * @file test_rgb.cpp
 * @brief Unit tests for Color/LinearRgb and Color/Srgb
 *
 * Tests cover:
 * - LinearRgb <-> Xyz matrices
 * - sRGB transfer curve on both sides of the linear segment
 * - Bounds, clamping, constants
 */

#include <gtest/gtest.h>
#include <Chroma/Color/LinearRgb.h>
#include <Chroma/Color/Srgb.h>

using namespace Chroma::Color;

namespace {

constexpr float TOL = 1e-5f;

void ExpectNear(const LinearRgb& actual, const LinearRgb& expected, float tol = TOL) {
    EXPECT_NEAR(actual.r, expected.r, tol);
    EXPECT_NEAR(actual.g, expected.g, tol);
    EXPECT_NEAR(actual.b, expected.b, tol);
}

void ExpectNear(const Srgb& actual, const Srgb& expected, float tol = TOL) {
    EXPECT_NEAR(actual.r, expected.r, tol);
    EXPECT_NEAR(actual.g, expected.g, tol);
    EXPECT_NEAR(actual.b, expected.b, tol);
}

} // namespace

// =============================================================================
// LinearRgb
// =============================================================================

TEST(LinearRgbTest, Constants) {
    EXPECT_EQ(LinearRgb::BLACK, LinearRgb(0.0f, 0.0f, 0.0f));
    EXPECT_EQ(LinearRgb::WHITE, LinearRgb(1.0f, 1.0f, 1.0f));
    EXPECT_TRUE(LinearRgb::BLACK.InBounds());
    EXPECT_TRUE(LinearRgb::WHITE.InBounds());
}

TEST(LinearRgbTest, WhiteMapsToD65) {
    Xyz xyz = LinearRgb::WHITE.ToXyz();
    EXPECT_NEAR(xyz.x, Xyz::WHITE.x, 1e-4f);
    EXPECT_NEAR(xyz.y, Xyz::WHITE.y, 1e-4f);
    EXPECT_NEAR(xyz.z, Xyz::WHITE.z, 1e-4f);
}

TEST(LinearRgbTest, ToXyzKnownValue) {
    Xyz xyz = LinearRgb(0.4f, 0.2f, 0.6f).ToXyz();
    EXPECT_NEAR(xyz.x, 0.34476028f, TOL);
    EXPECT_NEAR(xyz.y, 0.27140460f, TOL);
    EXPECT_NEAR(xyz.z, 0.60175442f, TOL);
}

TEST(LinearRgbTest, FromXyzInvertsToXyz) {
    LinearRgb rgb(0.4f, 0.2f, 0.6f);
    ExpectNear(LinearRgb::FromXyz(rgb.ToXyz()), rgb, 1e-4f);
    ExpectNear(LinearRgb::FromXyz(Xyz::WHITE), LinearRgb::WHITE, 1e-4f);
}

TEST(LinearRgbTest, BlackMapsToBlack) {
    EXPECT_EQ(LinearRgb::BLACK.ToXyz(), Xyz::BLACK);
    EXPECT_EQ(LinearRgb::FromXyz(Xyz::BLACK), LinearRgb::BLACK);
}

TEST(LinearRgbTest, InBounds) {
    EXPECT_TRUE(LinearRgb(0.25f, 0.75f, 0.25f).InBounds());
    EXPECT_TRUE(LinearRgb(1.004f, 0.0f, -0.004f).InBounds());
    EXPECT_FALSE(LinearRgb(2.0f, -100.0f, 0.5f).InBounds());
    EXPECT_FALSE(LinearRgb(0.5f, 0.5f, 1.01f).InBounds());
}

TEST(LinearRgbTest, Clamped) {
    EXPECT_EQ(LinearRgb(2.0f, -100.0f, 0.5f).Clamped(), LinearRgb(1.0f, 0.0f, 0.5f));
    EXPECT_TRUE(LinearRgb(2.0f, -100.0f, 0.5f).Clamped().InBounds());
}

// =============================================================================
// Srgb
// =============================================================================

TEST(SrgbTest, Constants) {
    EXPECT_EQ(Srgb::BLACK, Srgb(0.0f, 0.0f, 0.0f));
    EXPECT_EQ(Srgb::WHITE, Srgb(1.0f, 1.0f, 1.0f));
    EXPECT_TRUE(Srgb::BLACK.InBounds());
    EXPECT_TRUE(Srgb::WHITE.InBounds());
}

TEST(SrgbTest, InBounds) {
    EXPECT_TRUE(Srgb(0.25f, 0.75f, 0.25f).InBounds());
    EXPECT_FALSE(Srgb(2.0f, -100.0f, 0.5f).InBounds());
}

TEST(SrgbTest, MidGrayDecodes) {
    LinearRgb linear = Srgb(0.5f, 0.5f, 0.5f).ToLinear();
    ExpectNear(linear, LinearRgb(0.21404114f, 0.21404114f, 0.21404114f));
}

TEST(SrgbTest, MidGrayEncodes) {
    Srgb srgb = Srgb::FromLinear(LinearRgb(0.5f, 0.5f, 0.5f));
    ExpectNear(srgb, Srgb(0.73535698f, 0.73535698f, 0.73535698f));
}

TEST(SrgbTest, LinearSegmentBelowThreshold) {
    Srgb srgb = Srgb::FromLinear(LinearRgb(0.001f, 0.002f, 0.003f));
    ExpectNear(srgb, Srgb(0.01292f, 0.02584f, 0.03876f), 1e-6f);

    LinearRgb linear = Srgb(0.01292f, 0.02584f, 0.03876f).ToLinear();
    ExpectNear(linear, LinearRgb(0.001f, 0.002f, 0.003f), 1e-6f);
}

TEST(SrgbTest, CurveContinuousAtThreshold) {
    float below = Srgb::FromLinear(LinearRgb(0.0031307f, 0.0f, 0.0f)).r;
    float above = Srgb::FromLinear(LinearRgb(0.0031309f, 0.0f, 0.0f)).r;
    EXPECT_NEAR(below, 0.04045f, 1e-5f);
    EXPECT_NEAR(above, 0.04045f, 1e-5f);
}

TEST(SrgbTest, EndpointsFixed) {
    ExpectNear(Srgb::FromLinear(LinearRgb::WHITE), Srgb::WHITE);
    ExpectNear(Srgb::WHITE.ToLinear(), LinearRgb::WHITE);
    EXPECT_EQ(Srgb::FromLinear(LinearRgb::BLACK), Srgb::BLACK);
    EXPECT_EQ(Srgb::BLACK.ToLinear(), LinearRgb::BLACK);
}

TEST(SrgbTest, RoundTripThroughLinear) {
    for (int i = 0; i <= 100; ++i) {
        float v = static_cast<float>(i) / 100.0f;
        Srgb srgb(v, 1.0f - v, v * v);
        ExpectNear(Srgb::FromLinear(srgb.ToLinear()), srgb, 1e-5f);
    }
}

TEST(SrgbTest, Clamped) {
    EXPECT_EQ(Srgb(1.5f, -0.5f, 0.25f).Clamped(), Srgb(1.0f, 0.0f, 0.25f));
}
