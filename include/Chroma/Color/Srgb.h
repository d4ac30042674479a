#pragma once

/**
 * @file Srgb.h
 * @brief Gamma-encoded sRGB, a variant of LinearRgb
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/LinearRgb.h>

#include <ostream>

namespace Chroma::Color {

/**
 * @brief Gamma-encoded (display-ready) sRGB, channels nominally in [0, 1]
 *
 * Not a core space: convert through LinearRgb with FromLinear() / ToLinear().
 * The round trip is exact up to float rounding.
 */
struct CHROMA_API Srgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    Srgb() = default;
    Srgb(float r_, float g_, float b_) : r(r_), g(g_), b(b_) {}

    static const Srgb BLACK;
    static const Srgb WHITE;

    bool InBounds() const;

    /// Copy with every channel clamped into [0, 1]
    Srgb Clamped() const;

    /// Apply the sRGB transfer curve to each channel
    static Srgb FromLinear(const LinearRgb& linear);

    /// Undo the sRGB transfer curve
    LinearRgb ToLinear() const;

    bool operator==(const Srgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Srgb& other) const { return !(*this == other); }
    bool operator<(const Srgb& other) const;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Srgb& rgb);

} // namespace Chroma::Color
