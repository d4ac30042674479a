/**
 * @file Srgb.cpp
 * @brief Srgb <-> LinearRgb transfer
 */

#include <Chroma/Color/Srgb.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Internal/ColorMath.h>

#include <tuple>

namespace Chroma::Color {

const Srgb Srgb::BLACK{0.0f, 0.0f, 0.0f};
const Srgb Srgb::WHITE{1.0f, 1.0f, 1.0f};

bool Srgb::InBounds() const {
    return ApproxInRange(r, 0.0f, 1.0f) &&
           ApproxInRange(g, 0.0f, 1.0f) &&
           ApproxInRange(b, 0.0f, 1.0f);
}

Srgb Srgb::Clamped() const {
    return {Clamp(r, 0.0f, 1.0f), Clamp(g, 0.0f, 1.0f), Clamp(b, 0.0f, 1.0f)};
}

Srgb Srgb::FromLinear(const LinearRgb& linear) {
    return {Internal::LinearToSrgb(linear.r),
            Internal::LinearToSrgb(linear.g),
            Internal::LinearToSrgb(linear.b)};
}

LinearRgb Srgb::ToLinear() const {
    return {Internal::SrgbToLinear(r),
            Internal::SrgbToLinear(g),
            Internal::SrgbToLinear(b)};
}

bool Srgb::operator<(const Srgb& other) const {
    return std::tie(r, g, b) < std::tie(other.r, other.g, other.b);
}

std::ostream& operator<<(std::ostream& os, const Srgb& rgb) {
    return os << "Srgb(" << rgb.r << ", " << rgb.g << ", " << rgb.b << ")";
}

} // namespace Chroma::Color
