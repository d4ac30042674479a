/**
 * @file Oklch.cpp
 * @brief Oklch <-> Oklab polar mapping
 */

#include <Chroma/Color/Oklch.h>
#include <Chroma/Core/Constants.h>

#include <cmath>
#include <limits>
#include <tuple>

namespace Chroma::Color {

const Oklch Oklch::BLACK{0.0f, 0.0f, Hue()};
const Oklch Oklch::WHITE{1.0f, 0.0f, Hue()};

bool Oklch::InBounds() const {
    return ApproxInRange(l, 0.0f, 1.0f) &&
           ApproxInRange(c, 0.0f, std::numeric_limits<float>::max());
}

Oklch Oklch::FromOklab(const Oklab& lab) {
    float chroma = std::hypot(lab.a, lab.b);
    if (chroma == 0.0f || !std::isfinite(chroma)) {
        return {lab.l, chroma, Hue()};
    }
    // atan2 is already in [-PI, PI]; FromRadians folds -PI onto PI
    return {lab.l, chroma, Hue::FromRadians(std::atan2(lab.b, lab.a))};
}

Oklab Oklch::ToOklab() const {
    float radians = h.ToRadians();
    return {l, c * std::cos(radians), c * std::sin(radians)};
}

bool Oklch::operator<(const Oklch& other) const {
    return std::tie(l, c, h) < std::tie(other.l, other.c, other.h);
}

std::ostream& operator<<(std::ostream& os, const Oklch& lch) {
    return os << "Oklch(" << lch.l << ", " << lch.c << ", " << lch.h << ")";
}

} // namespace Chroma::Color
