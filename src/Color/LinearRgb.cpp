/**
 * @file LinearRgb.cpp
 * @brief LinearRgb <-> Xyz conversion
 */

#include <Chroma/Color/LinearRgb.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Internal/ColorMath.h>

#include <tuple>

namespace Chroma::Color {

const LinearRgb LinearRgb::BLACK{0.0f, 0.0f, 0.0f};
const LinearRgb LinearRgb::WHITE{1.0f, 1.0f, 1.0f};

bool LinearRgb::InBounds() const {
    return ApproxInRange(r, 0.0f, 1.0f) &&
           ApproxInRange(g, 0.0f, 1.0f) &&
           ApproxInRange(b, 0.0f, 1.0f);
}

LinearRgb LinearRgb::Clamped() const {
    return {Clamp(r, 0.0f, 1.0f), Clamp(g, 0.0f, 1.0f), Clamp(b, 0.0f, 1.0f)};
}

LinearRgb LinearRgb::FromXyz(const Xyz& xyz) {
    LinearRgb rgb;
    Internal::Multiply3x3(Internal::XYZ_TO_LINEAR_RGB, xyz.x, xyz.y, xyz.z,
                          rgb.r, rgb.g, rgb.b);
    return rgb;
}

Xyz LinearRgb::ToXyz() const {
    Xyz xyz;
    Internal::Multiply3x3(Internal::LINEAR_RGB_TO_XYZ, r, g, b, xyz.x, xyz.y, xyz.z);
    return xyz;
}

bool LinearRgb::operator<(const LinearRgb& other) const {
    return std::tie(r, g, b) < std::tie(other.r, other.g, other.b);
}

std::ostream& operator<<(std::ostream& os, const LinearRgb& rgb) {
    return os << "LinearRgb(" << rgb.r << ", " << rgb.g << ", " << rgb.b << ")";
}

} // namespace Chroma::Color
