/**
 * @file Hue.cpp
 * @brief Hue implementation
 */

#include <Chroma/Color/Hue.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Core/Validate.h>

#include <cmath>

namespace Chroma::Color {

namespace {

// Map [0, 360] degrees into (-180, 180] and convert to radians
inline float DegreesToUnnormalizedRadians(float degrees) {
    float unnormalizedDegrees = (degrees > 180.0f) ? degrees - 360.0f : degrees;
    return unnormalizedDegrees * DEG_TO_RAD;
}

// Wrap any finite angle into (-PI, PI]
inline float WrapRadians(float radians) {
    float wrapped = std::remainder(radians, TWO_PI);
    if (wrapped <= -PI) {
        wrapped += TWO_PI;
    }
    return wrapped;
}

} // namespace

Hue Hue::FromDegrees(float degrees) {
    Validate::RequireRange(degrees, 0.0f, 360.0f, "degrees", "Hue::FromDegrees");
    Validate::RequireFinite(degrees, "degrees", "Hue::FromDegrees");
    return Hue(DegreesToUnnormalizedRadians(degrees));
}

std::optional<Hue> Hue::TryFromDegrees(float degrees) {
    // Written as a positive range test so NaN falls through to empty
    if (!(degrees >= 0.0f && degrees <= 360.0f)) {
        return std::nullopt;
    }
    return Hue(DegreesToUnnormalizedRadians(degrees));
}

Hue Hue::FromRadians(float radians) {
    CHROMA_REQUIRE_FINITE(radians);
    return Hue(WrapRadians(radians));
}

float Hue::ToDegrees() const {
    float unnormalizedDegrees = unnormalizedRadians_ * RAD_TO_DEG;
    float degrees = (unnormalizedDegrees < 0.0f) ? unnormalizedDegrees + 360.0f
                                                 : unnormalizedDegrees;
    // -tiny + 360 rounds to 360 in float
    return (degrees >= 360.0f) ? 0.0f : degrees;
}

Hue Hue::Rotated(float deltaDegrees) const {
    CHROMA_REQUIRE_FINITE(deltaDegrees);
    return Hue(WrapRadians(unnormalizedRadians_ + deltaDegrees * DEG_TO_RAD));
}

std::ostream& operator<<(std::ostream& os, const Hue& hue) {
    return os << "Hue(" << hue.ToDegrees() << " deg)";
}

} // namespace Chroma::Color
