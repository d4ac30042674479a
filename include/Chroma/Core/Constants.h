#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and small helpers shared by all color spaces
 */

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Chroma {

// =============================================================================
// Math Constants
// =============================================================================

constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;
constexpr float DEG_TO_RAD = PI / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / PI;

// =============================================================================
// Color Constants
// =============================================================================

/// Slack applied to every nominal channel range by InBounds()
constexpr float BOUNDS_TOLERANCE = 0.005f;

/// Largest 8-bit channel value of the hex encoding
constexpr int32_t HEX_MAX_CHANNEL = 255;

/// D65 / 2 degree reference white
constexpr float D65_X = 0.95047f;
constexpr float D65_Y = 1.0f;
constexpr float D65_Z = 1.08883f;

// =============================================================================
// Helpers
// =============================================================================

/// Absolute-tolerance float comparison
inline bool ApproxEqual(float a, float b, float tolerance = 1e-6f) {
    return std::abs(a - b) <= tolerance;
}

template<typename T>
constexpr T Clamp(T value, T minVal, T maxVal) {
    return std::max(minVal, std::min(maxVal, value));
}

/// True when value lies in [minVal, maxVal] widened by BOUNDS_TOLERANCE.
/// NaN is never in range.
inline bool ApproxInRange(float value, float minVal, float maxVal) {
    return value >= minVal - BOUNDS_TOLERANCE && value <= maxVal + BOUNDS_TOLERANCE;
}

} // namespace Chroma
