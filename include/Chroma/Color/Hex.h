#pragma once

/**
 * @file Hex.h
 * @brief 8-bit-per-channel hexadecimal form of Srgb
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/Srgb.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Chroma::Color {

/**
 * @brief Srgb quantized to 8 bits per channel, written as "rrggbb"
 *
 * This is the only lossy step in the library: Srgb -> Hex -> Srgb is
 * accurate to within half of 1/255 per channel for in-range input.
 *
 * Accepted text: exactly six hex digits, case-insensitive, optionally
 * preceded by a single '#'. Output is lower-case.
 */
struct CHROMA_API Hex {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    Hex() = default;
    Hex(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    static const Hex BLACK;
    static const Hex WHITE;

    /// Always true: every byte triple is a valid sRGB color
    bool InBounds() const { return true; }

    /// Round each channel to the nearest of 256 levels, clamping out-of-range input
    static Hex FromSrgb(const Srgb& srgb);

    /// Divide each byte by 255
    Srgb ToSrgb() const;

    /**
     * @brief Parse "rrggbb" or "#rrggbb"
     * @throws FormatException on any other shape
     */
    static Hex Parse(std::string_view text);

    /// Non-throwing variant of Parse()
    static std::optional<Hex> TryParse(std::string_view text);

    /// Packed 0xRRGGBB; bits above 24 are ignored
    static Hex FromPacked(uint32_t packed);
    uint32_t ToPacked() const;

    /// "rrggbb"
    std::string ToString() const;

    /// "#rrggbb"
    std::string ToCssString() const;

    bool operator==(const Hex& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Hex& other) const { return !(*this == other); }
    bool operator<(const Hex& other) const { return ToPacked() < other.ToPacked(); }
};

CHROMA_API std::ostream& operator<<(std::ostream& os, const Hex& hex);

} // namespace Chroma::Color
