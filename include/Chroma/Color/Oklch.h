#pragma once

/**
 * @file Oklch.h
 * @brief Polar form of Oklab
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/Hue.h>
#include <Chroma/Color/Oklab.h>

#include <ostream>

namespace Chroma::Color {

/**
 * @brief Oklch color: lightness, chroma, hue
 *
 * a = c * cos(h), b = c * sin(h); l is shared with Oklab.
 * Not a core space: convert through Oklab with FromOklab() / ToOklab().
 */
struct CHROMA_API Oklch {
    float l = 0.0f;  ///< Perceived lightness, [0, 1]
    float c = 0.0f;  ///< Chroma, >= 0
    Hue h;           ///< Meaningless when c == 0; 0 degrees by convention

    Oklch() = default;
    Oklch(float l_, float c_, Hue h_) : l(l_), c(c_), h(h_) {}

    static const Oklch BLACK;
    static const Oklch WHITE;

    /// l within [0, 1] and c >= 0, both tolerant
    bool InBounds() const;

    static Oklch FromOklab(const Oklab& lab);
    Oklab ToOklab() const;

    bool operator==(const Oklch& other) const {
        return l == other.l && c == other.c && h == other.h;
    }
    bool operator!=(const Oklch& other) const { return !(*this == other); }
    bool operator<(const Oklch& other) const;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Oklch& lch);

} // namespace Chroma::Color
