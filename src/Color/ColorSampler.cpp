/**
 * @file ColorSampler.cpp
 * @brief Random color generation implementation
 */

#include <Chroma/Color/ColorSampler.h>
#include <Chroma/Color/Convert.h>

#include <chrono>
#include <functional>
#include <thread>

namespace Chroma::Color {

ColorSampler& ColorSampler::Instance() {
    thread_local ColorSampler instance;
    return instance;
}

ColorSampler::ColorSampler() {
    // Combine time and thread ID so threads start from distinct states
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void ColorSampler::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
    unitDist_.reset();
}

float ColorSampler::Unit() {
    // uniform_real_distribution<float> may round up to 1.0f on some libraries
    float val = unitDist_(gen_);
    return (val < 1.0f) ? val : 0.0f;
}

Hue ColorSampler::NextHue() {
    return Hue::FromDegrees(Unit() * 360.0f);
}

Srgb ColorSampler::NextSrgb() {
    return {Unit(), Unit(), Unit()};
}

LinearRgb ColorSampler::NextLinearRgb() {
    return {Unit(), Unit(), Unit()};
}

Hex ColorSampler::NextHex() {
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    return Hex::FromPacked(dist(gen_));
}

Xyz ColorSampler::NextXyz() {
    return Convert<Xyz>(NextLinearRgb());
}

Oklab ColorSampler::NextOklab() {
    return Convert<Oklab>(NextLinearRgb());
}

Oklch ColorSampler::NextOklch() {
    return Oklch::FromOklab(NextOklab());
}

} // namespace Chroma::Color
