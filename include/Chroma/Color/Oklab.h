#pragma once

/**
 * @file Oklab.h
 * @brief Oklab perceptually uniform color space
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/Xyz.h>

#include <ostream>

namespace Chroma::Color {

/**
 * @brief Oklab color
 *
 * a and b are unbounded opponent axes; for display colors they stay roughly
 * within [-0.4, 0.4].
 */
struct CHROMA_API Oklab {
    float l = 0.0f;  ///< Perceived lightness, [0, 1]
    float a = 0.0f;  ///< Green (-) to red (+)
    float b = 0.0f;  ///< Blue (-) to yellow (+)

    Oklab() = default;
    Oklab(float l_, float a_, float b_) : l(l_), a(a_), b(b_) {}

    static const Oklab BLACK;
    static const Oklab WHITE;

    /// l within [0, 1] (tolerant); a and b only need to be finite
    bool InBounds() const;

    static Oklab FromXyz(const Xyz& xyz);
    Xyz ToXyz() const;

    bool operator==(const Oklab& other) const {
        return l == other.l && a == other.a && b == other.b;
    }
    bool operator!=(const Oklab& other) const { return !(*this == other); }
    bool operator<(const Oklab& other) const;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Oklab& lab);

} // namespace Chroma::Color
