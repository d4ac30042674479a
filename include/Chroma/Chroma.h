#pragma once

/**
 * @file Chroma.h
 * @brief Main header file for Chroma library
 *
 * Chroma converts colors between XYZ, linear RGB, sRGB, hex, Oklab and
 * Oklch, routing every cross-space conversion through XYZ.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <Chroma/ChromaConfig.h>
#include <Chroma/Core/Export.h>

// Core types and utilities
#include <Chroma/Core/Constants.h>
#include <Chroma/Core/Exception.h>

// Color spaces
#include <Chroma/Color/Hue.h>
#include <Chroma/Color/Xyz.h>
#include <Chroma/Color/LinearRgb.h>
#include <Chroma/Color/Srgb.h>
#include <Chroma/Color/Oklab.h>
#include <Chroma/Color/Oklch.h>
#include <Chroma/Color/Hex.h>

// Conversion
#include <Chroma/Color/ColorSpace.h>
#include <Chroma/Color/Convert.h>
#include <Chroma/Color/ColorSampler.h>

namespace Chroma {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return CHROMA_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = CHROMA_VERSION_MAJOR;
    minor = CHROMA_VERSION_MINOR;
    patch = CHROMA_VERSION_PATCH;
}

/**
 * @brief True when batch conversion was built with OpenMP
 */
inline bool HasOpenMP() {
    return CHROMA_HAS_OPENMP != 0;
}

} // namespace Chroma
