#pragma once

/**
 * @file Convert.h
 * @brief Conversion between core color spaces through the Xyz hub
 *
 * Usage:
 * @code
 * Oklab lab = Convert<Oklab>(LinearRgb(0.4f, 0.2f, 0.6f));
 *
 * // Variants ride on their core space
 * Srgb srgb = Srgb::FromLinear(Convert<LinearRgb>(Oklch(0.8f, 0.25f, hue).ToOklab()));
 * Hex hex = Hex::FromSrgb(srgb);
 * @endcode
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/ColorSpace.h>

#include <type_traits>
#include <vector>

namespace Chroma::Color {

/**
 * @brief Convert a color between two core spaces: In -> Xyz -> Out
 *
 * Total and non-throwing. Converting a space to itself returns the input
 * unchanged.
 */
template<typename Out, typename In>
Out Convert(const In& color) {
    static_assert(IsCoreColorSpace<In>::value, "Convert: input is not a core color space");
    static_assert(IsCoreColorSpace<Out>::value, "Convert: output is not a core color space");

    if constexpr (std::is_same_v<In, Out>) {
        return color;
    } else {
        return Out::FromXyz(color.ToXyz());
    }
}

/**
 * @brief Convert every element of input into output
 *
 * Parallelized with OpenMP when available. Results are identical to
 * element-wise Convert().
 *
 * @throws InvalidArgumentException if output.size() != input.size()
 */
template<typename Out, typename In>
void ConvertBatch(const std::vector<In>& input, std::vector<Out>& output);

/**
 * @brief Convert every element of input into a new vector
 */
template<typename Out, typename In>
std::vector<Out> ConvertBatch(const std::vector<In>& input) {
    std::vector<Out> output(input.size());
    ConvertBatch(input, output);
    return output;
}

// Instantiated in Convert.cpp for every pair of core spaces
#define CHROMA_EXTERN_CONVERT_BATCH(In, Out) \
    extern template void ConvertBatch<Out, In>(const std::vector<In>&, std::vector<Out>&)

CHROMA_EXTERN_CONVERT_BATCH(Xyz, Xyz);
CHROMA_EXTERN_CONVERT_BATCH(Xyz, LinearRgb);
CHROMA_EXTERN_CONVERT_BATCH(Xyz, Oklab);
CHROMA_EXTERN_CONVERT_BATCH(LinearRgb, Xyz);
CHROMA_EXTERN_CONVERT_BATCH(LinearRgb, LinearRgb);
CHROMA_EXTERN_CONVERT_BATCH(LinearRgb, Oklab);
CHROMA_EXTERN_CONVERT_BATCH(Oklab, Xyz);
CHROMA_EXTERN_CONVERT_BATCH(Oklab, LinearRgb);
CHROMA_EXTERN_CONVERT_BATCH(Oklab, Oklab);

#undef CHROMA_EXTERN_CONVERT_BATCH

} // namespace Chroma::Color
