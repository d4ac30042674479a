/**
 * @file Hex.cpp
 * @brief Hex encoding and parsing
 */

#include <Chroma/Color/Hex.h>
#include <Chroma/Core/Constants.h>
#include <Chroma/Core/Exception.h>

#include <cmath>

namespace Chroma::Color {

namespace {

constexpr size_t HEX_DIGITS = 6;
constexpr char HEX_MARKER = '#';
constexpr char LOWER_DIGITS[] = "0123456789abcdef";

inline uint8_t QuantizeChannel(float val) {
    // NaN maps to 0
    if (!(val > 0.0f)) return 0;
    if (val >= 1.0f) return static_cast<uint8_t>(HEX_MAX_CHANNEL);
    return static_cast<uint8_t>(std::lround(val * HEX_MAX_CHANNEL));
}

// -1 for a non-hex character
inline int HexDigitValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

// Shared by Parse/TryParse; returns false on malformed input
bool ParsePacked(std::string_view text, uint32_t& packed) {
    if (!text.empty() && text.front() == HEX_MARKER) {
        text.remove_prefix(1);
    }
    if (text.size() != HEX_DIGITS) {
        return false;
    }

    packed = 0;
    for (char ch : text) {
        int digit = HexDigitValue(ch);
        if (digit < 0) {
            return false;
        }
        packed = (packed << 4) | static_cast<uint32_t>(digit);
    }
    return true;
}

} // namespace

const Hex Hex::BLACK{0x00, 0x00, 0x00};
const Hex Hex::WHITE{0xFF, 0xFF, 0xFF};

Hex Hex::FromSrgb(const Srgb& srgb) {
    return {QuantizeChannel(srgb.r), QuantizeChannel(srgb.g), QuantizeChannel(srgb.b)};
}

Srgb Hex::ToSrgb() const {
    constexpr float scale = 1.0f / HEX_MAX_CHANNEL;
    return {r * scale, g * scale, b * scale};
}

Hex Hex::Parse(std::string_view text) {
    uint32_t packed = 0;
    if (!ParsePacked(text, packed)) {
        throw FormatException("Hex::Parse: expected 6 hex digits with optional '#', got \"" +
                              std::string(text) + "\"");
    }
    return FromPacked(packed);
}

std::optional<Hex> Hex::TryParse(std::string_view text) {
    uint32_t packed = 0;
    if (!ParsePacked(text, packed)) {
        return std::nullopt;
    }
    return FromPacked(packed);
}

Hex Hex::FromPacked(uint32_t packed) {
    return {static_cast<uint8_t>((packed >> 16) & 0xFF),
            static_cast<uint8_t>((packed >> 8) & 0xFF),
            static_cast<uint8_t>(packed & 0xFF)};
}

uint32_t Hex::ToPacked() const {
    return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) |
           static_cast<uint32_t>(b);
}

std::string Hex::ToString() const {
    std::string text(HEX_DIGITS, '0');
    uint32_t packed = ToPacked();
    for (size_t i = HEX_DIGITS; i-- > 0;) {
        text[i] = LOWER_DIGITS[packed & 0xF];
        packed >>= 4;
    }
    return text;
}

std::string Hex::ToCssString() const {
    return HEX_MARKER + ToString();
}

std::ostream& operator<<(std::ostream& os, const Hex& hex) {
    return os << "Hex(" << hex.ToCssString() << ")";
}

} // namespace Chroma::Color
