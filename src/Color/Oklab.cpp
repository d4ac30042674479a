/**
 * @file Oklab.cpp
 * @brief Oklab <-> Xyz conversion
 *
 * XYZ -> M1 -> LMS -> cube root -> M2 -> Lab, and the reverse with the
 * inverse matrices and cubing.
 */

#include <Chroma/Color/Oklab.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Internal/ColorMath.h>

#include <cmath>
#include <tuple>

namespace Chroma::Color {

const Oklab Oklab::BLACK{0.0f, 0.0f, 0.0f};
const Oklab Oklab::WHITE{1.0f, 0.0f, 0.0f};

bool Oklab::InBounds() const {
    return ApproxInRange(l, 0.0f, 1.0f) && std::isfinite(a) && std::isfinite(b);
}

Oklab Oklab::FromXyz(const Xyz& xyz) {
    float lmsL, lmsM, lmsS;
    Internal::Multiply3x3(Internal::XYZ_TO_LMS, xyz.x, xyz.y, xyz.z, lmsL, lmsM, lmsS);

    // cbrt keeps the sign of small negative responses from rounding noise
    lmsL = std::cbrt(lmsL);
    lmsM = std::cbrt(lmsM);
    lmsS = std::cbrt(lmsS);

    Oklab lab;
    Internal::Multiply3x3(Internal::LMS_TO_OKLAB, lmsL, lmsM, lmsS, lab.l, lab.a, lab.b);
    return lab;
}

Xyz Oklab::ToXyz() const {
    float lmsL, lmsM, lmsS;
    Internal::Multiply3x3(Internal::OKLAB_TO_LMS, l, a, b, lmsL, lmsM, lmsS);

    lmsL = lmsL * lmsL * lmsL;
    lmsM = lmsM * lmsM * lmsM;
    lmsS = lmsS * lmsS * lmsS;

    Xyz xyz;
    Internal::Multiply3x3(Internal::LMS_TO_XYZ, lmsL, lmsM, lmsS, xyz.x, xyz.y, xyz.z);
    return xyz;
}

bool Oklab::operator<(const Oklab& other) const {
    return std::tie(l, a, b) < std::tie(other.l, other.a, other.b);
}

std::ostream& operator<<(std::ostream& os, const Oklab& lab) {
    return os << "Oklab(" << lab.l << ", " << lab.a << ", " << lab.b << ")";
}

} // namespace Chroma::Color
