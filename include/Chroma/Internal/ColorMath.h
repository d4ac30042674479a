#pragma once

/**
 * @file ColorMath.h
 * @brief Fixed conversion matrices and per-channel transfer functions
 *
 * All matrices are row-major 3x3 and multiply column vectors.
 * Inverse matrices are stored as published constants, not derived at runtime.
 */

#include <cmath>

namespace Chroma::Internal {

// =============================================================================
// Matrices
// =============================================================================

// Linear sRGB to XYZ (D65)
constexpr float LINEAR_RGB_TO_XYZ[3][3] = {
    {0.4124564f, 0.3575761f, 0.1804375f},
    {0.2126729f, 0.7151522f, 0.0721750f},
    {0.0193339f, 0.1191920f, 0.9503041f}
};

// XYZ (D65) to linear sRGB
constexpr float XYZ_TO_LINEAR_RGB[3][3] = {
    { 3.2404542f, -1.5371385f, -0.4985314f},
    {-0.9692660f,  1.8760108f,  0.0415560f},
    { 0.0556434f, -0.2040259f,  1.0572252f}
};

// XYZ to LMS cone response (Oklab M1)
constexpr float XYZ_TO_LMS[3][3] = {
    {0.8189330101f, 0.3618667424f, -0.1288597137f},
    {0.0329845436f, 0.9293118715f,  0.0361456387f},
    {0.0482003018f, 0.2643662691f,  0.6338517070f}
};

// LMS cone response to XYZ (inverse of M1)
constexpr float LMS_TO_XYZ[3][3] = {
    { 1.2270138511f, -0.5577999807f,  0.2812561490f},
    {-0.0405801784f,  1.1122568696f, -0.0716766787f},
    {-0.0763812845f, -0.4214819784f,  1.5861632204f}
};

// Non-linear LMS to Oklab (Oklab M2)
constexpr float LMS_TO_OKLAB[3][3] = {
    {0.2104542553f,  0.7936177850f, -0.0040720468f},
    {1.9779984951f, -2.4285922050f,  0.4505937099f},
    {0.0259040371f,  0.7827717662f, -0.8086757660f}
};

// Oklab to non-linear LMS (inverse of M2)
constexpr float OKLAB_TO_LMS[3][3] = {
    {1.0f,  0.3963377774f,  0.2158037573f},
    {1.0f, -0.1055613458f, -0.0638541728f},
    {1.0f, -0.0894841775f, -1.2914855480f}
};

/**
 * @brief Multiply a 3x3 matrix by the column vector (in0, in1, in2)
 */
inline void Multiply3x3(const float m[3][3], float in0, float in1, float in2,
                        float& out0, float& out1, float& out2) {
    out0 = m[0][0] * in0 + m[0][1] * in1 + m[0][2] * in2;
    out1 = m[1][0] * in0 + m[1][1] * in1 + m[1][2] * in2;
    out2 = m[2][0] * in0 + m[2][1] * in1 + m[2][2] * in2;
}

// =============================================================================
// Transfer Functions
// =============================================================================

// sRGB transfer curve constants (IEC 61966-2-1)
constexpr float SRGB_LINEAR_THRESHOLD = 0.0031308f;
constexpr float SRGB_ENCODED_THRESHOLD = 0.04045f;
constexpr float SRGB_LINEAR_SLOPE = 12.92f;
constexpr float SRGB_SCALE = 1.055f;
constexpr float SRGB_OFFSET = 0.055f;
constexpr float SRGB_GAMMA = 2.4f;

/// Gamma-encode one linear channel
inline float LinearToSrgb(float val) {
    return (val <= SRGB_LINEAR_THRESHOLD)
        ? val * SRGB_LINEAR_SLOPE
        : SRGB_SCALE * std::pow(val, 1.0f / SRGB_GAMMA) - SRGB_OFFSET;
}

/// Decode one gamma-encoded channel back to linear light
inline float SrgbToLinear(float val) {
    return (val <= SRGB_ENCODED_THRESHOLD)
        ? val / SRGB_LINEAR_SLOPE
        : std::pow((val + SRGB_OFFSET) / SRGB_SCALE, SRGB_GAMMA);
}

} // namespace Chroma::Internal
