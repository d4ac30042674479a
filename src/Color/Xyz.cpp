/**
 * @file Xyz.cpp
 * @brief Xyz implementation
 */

#include <Chroma/Color/Xyz.h>
#include <Chroma/Core/Constants.h>

#include <tuple>

namespace Chroma::Color {

const Xyz Xyz::BLACK{0.0f, 0.0f, 0.0f};
const Xyz Xyz::WHITE{D65_X, D65_Y, D65_Z};

bool Xyz::InBounds() const {
    return ApproxInRange(x, 0.0f, D65_X) &&
           ApproxInRange(y, 0.0f, D65_Y) &&
           ApproxInRange(z, 0.0f, D65_Z);
}

bool Xyz::operator<(const Xyz& other) const {
    return std::tie(x, y, z) < std::tie(other.x, other.y, other.z);
}

std::ostream& operator<<(std::ostream& os, const Xyz& xyz) {
    return os << "Xyz(" << xyz.x << ", " << xyz.y << ", " << xyz.z << ")";
}

} // namespace Chroma::Color
