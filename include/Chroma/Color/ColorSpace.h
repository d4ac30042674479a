#pragma once

/**
 * @file ColorSpace.h
 * @brief Compile-time color space contract
 *
 * Every color space exposes:
 * - static const T BLACK, WHITE (both satisfy InBounds())
 * - bool InBounds() const, tolerant by BOUNDS_TOLERANCE
 *
 * Core spaces additionally expose:
 * - static T FromXyz(const Xyz&)
 * - Xyz ToXyz() const
 *
 * Variants (Srgb, Oklch, Hex) only map one hop to their core space.
 */

#include <Chroma/Color/Hex.h>
#include <Chroma/Color/LinearRgb.h>
#include <Chroma/Color/Oklab.h>
#include <Chroma/Color/Oklch.h>
#include <Chroma/Color/Srgb.h>
#include <Chroma/Color/Xyz.h>

#include <type_traits>

namespace Chroma::Color {

/**
 * @brief Per-space traits; unspecialized types are not color spaces
 */
template<typename T>
struct ColorSpaceTraits {
    static constexpr bool IS_COLOR_SPACE = false;
    static constexpr bool IS_CORE = false;
};

#define CHROMA_DECLARE_COLOR_SPACE(Type, isCore)        \
    template<>                                          \
    struct ColorSpaceTraits<Type> {                     \
        static constexpr bool IS_COLOR_SPACE = true;    \
        static constexpr bool IS_CORE = isCore;         \
        static constexpr const char* NAME = #Type;      \
    }

CHROMA_DECLARE_COLOR_SPACE(Xyz, true);
CHROMA_DECLARE_COLOR_SPACE(LinearRgb, true);
CHROMA_DECLARE_COLOR_SPACE(Oklab, true);
CHROMA_DECLARE_COLOR_SPACE(Srgb, false);
CHROMA_DECLARE_COLOR_SPACE(Oklch, false);
CHROMA_DECLARE_COLOR_SPACE(Hex, false);

#undef CHROMA_DECLARE_COLOR_SPACE

template<typename T>
struct IsColorSpace
    : std::bool_constant<ColorSpaceTraits<std::remove_cv_t<T>>::IS_COLOR_SPACE> {};

template<typename T>
struct IsCoreColorSpace
    : std::bool_constant<ColorSpaceTraits<std::remove_cv_t<T>>::IS_CORE> {};

/// Type name for diagnostics ("Oklab", "Hex", ...)
template<typename T>
constexpr const char* ColorSpaceName() {
    static_assert(IsColorSpace<T>::value, "ColorSpaceName: not a color space");
    return ColorSpaceTraits<T>::NAME;
}

} // namespace Chroma::Color
