#pragma once

/**
 * @file Hue.h
 * @brief Angular hue shared by polar color spaces
 */

#include <Chroma/Core/Export.h>

#include <optional>
#include <ostream>

namespace Chroma::Color {

/**
 * @brief Hue angle
 *
 * Stored as radians in (-PI, PI]: degrees above 180 are shifted down by 360
 * before conversion, so trigonometry stays continuous across the 0/360 seam.
 * ToDegrees() maps back into [0, 360).
 */
class CHROMA_API Hue {
public:
    /// 0 degrees
    Hue() = default;

    /**
     * @brief Create hue from degrees
     * @param degrees Angle in [0, 360]
     * @throws OutOfRangeException if degrees is outside [0, 360]
     * @throws InvalidArgumentException if degrees is NaN
     */
    static Hue FromDegrees(float degrees);

    /**
     * @brief Non-throwing variant of FromDegrees()
     * @return Empty if degrees is NaN or outside [0, 360]
     */
    static std::optional<Hue> TryFromDegrees(float degrees);

    /**
     * @brief Create hue from any finite angle in radians, wrapping it into (-PI, PI]
     * @throws InvalidArgumentException if radians is not finite
     */
    static Hue FromRadians(float radians);

    /// Hue in degrees, in [0, 360)
    float ToDegrees() const;

    /// Hue in radians, in (-PI, PI]
    float ToRadians() const { return unnormalizedRadians_; }

    /**
     * @brief Rotate by a signed number of degrees, wrapping around the circle
     * @throws InvalidArgumentException if deltaDegrees is not finite
     */
    Hue Rotated(float deltaDegrees) const;

    bool operator==(const Hue& other) const {
        return unnormalizedRadians_ == other.unnormalizedRadians_;
    }
    bool operator!=(const Hue& other) const { return !(*this == other); }
    bool operator<(const Hue& other) const {
        return unnormalizedRadians_ < other.unnormalizedRadians_;
    }

private:
    explicit Hue(float unnormalizedRadians) : unnormalizedRadians_(unnormalizedRadians) {}

    float unnormalizedRadians_ = 0.0f;
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Hue& hue);

} // namespace Chroma::Color
