#pragma once

/**
 * @file Xyz.h
 * @brief CIE 1931 XYZ, the hub every core color space converts through
 */

#include <Chroma/Core/Export.h>

#include <ostream>

namespace Chroma::Color {

/**
 * @brief CIE 1931 XYZ color, D65 illuminant, 2 degree observer
 */
struct CHROMA_API Xyz {
    float x = 0.0f;  ///< Mixture of cone responses, [0, 0.95047]
    float y = 0.0f;  ///< Luminance, [0, 1]
    float z = 0.0f;  ///< Roughly blueness, [0, 1.08883]

    Xyz() = default;
    Xyz(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    static const Xyz BLACK;
    static const Xyz WHITE;  ///< D65 reference white

    /// Channels within nominal range, widened by BOUNDS_TOLERANCE
    bool InBounds() const;

    /// Identity: XYZ is its own hub
    static Xyz FromXyz(const Xyz& xyz) { return xyz; }
    Xyz ToXyz() const { return *this; }

    bool operator==(const Xyz& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
    bool operator!=(const Xyz& other) const { return !(*this == other); }
    bool operator<(const Xyz& other) const;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Xyz& xyz);

} // namespace Chroma::Color
