#pragma once

/**
 * @file LinearRgb.h
 * @brief Light-linear RGB with sRGB primaries
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/Xyz.h>

#include <ostream>

namespace Chroma::Color {

/**
 * @brief Linear (gamma-uncorrected) RGB, sRGB primaries, D65 white
 *
 * Each channel is nominally in [0, 1].
 */
struct CHROMA_API LinearRgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    LinearRgb() = default;
    LinearRgb(float r_, float g_, float b_) : r(r_), g(g_), b(b_) {}

    static const LinearRgb BLACK;
    static const LinearRgb WHITE;

    bool InBounds() const;

    /// Copy with every channel clamped into [0, 1]
    LinearRgb Clamped() const;

    static LinearRgb FromXyz(const Xyz& xyz);
    Xyz ToXyz() const;

    bool operator==(const LinearRgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const LinearRgb& other) const { return !(*this == other); }
    bool operator<(const LinearRgb& other) const;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const LinearRgb& rgb);

} // namespace Chroma::Color
