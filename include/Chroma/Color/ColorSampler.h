#pragma once

/**
 * @file ColorSampler.h
 * @brief Random color generation
 *
 * Provides reproducible random colors for:
 * - Palette generation
 * - Property-style test fixtures
 *
 * Every color returned lies inside the sRGB gamut, so it satisfies InBounds()
 * in every space.
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Color/ColorSpace.h>
#include <Chroma/Color/Hue.h>

#include <cstdint>
#include <random>

namespace Chroma::Color {

/**
 * @brief Thread-local random color generator
 *
 * Uses MT19937-64. Each thread has its own generator instance.
 */
class CHROMA_API ColorSampler {
public:
    /**
     * @brief Get thread-local sampler instance
     */
    static ColorSampler& Instance();

    /**
     * @brief Reseed the current thread's generator for reproducibility
     */
    void SetSeed(uint64_t seed);

    uint64_t GetSeed() const { return seed_; }

    /// Hue uniformly distributed in [0, 360)
    Hue NextHue();

    Srgb NextSrgb();
    LinearRgb NextLinearRgb();
    Hex NextHex();

    /// Derived from NextLinearRgb() through the Xyz hub
    Xyz NextXyz();
    Oklab NextOklab();
    Oklch NextOklch();

private:
    ColorSampler();
    ColorSampler(const ColorSampler&) = delete;
    ColorSampler& operator=(const ColorSampler&) = delete;

    /// Uniform float in [0, 1)
    float Unit();

    std::mt19937_64 gen_;
    uint64_t seed_;
    std::uniform_real_distribution<float> unitDist_{0.0f, 1.0f};
};

} // namespace Chroma::Color
