#pragma once

/**
 * @file Validate.h
 * @brief Unified argument validation for Chroma
 *
 * Design principles:
 * - Checks only guard construction from external input and buffer plumbing;
 *   color conversions themselves are total and never validate
 * - Consistent error message format: "<funcName>: <param> must be ..., got <value>"
 */

#include <Chroma/Core/Export.h>
#include <Chroma/Core/Exception.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Chroma::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format floating point with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Value Validation
// =============================================================================

/**
 * @brief Validate value is not NaN or infinite
 * @throws InvalidArgumentException otherwise
 */
inline void RequireFinite(float value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is in [minVal, maxVal] (inclusive, no tolerance)
 * @throws OutOfRangeException otherwise
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw OutOfRangeException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

// =============================================================================
// Buffer Validation
// =============================================================================

/**
 * @brief Validate input and output buffers have the same element count
 * @throws InvalidArgumentException otherwise
 */
inline void RequireSameSize(size_t inputSize, size_t outputSize, const char* funcName) {
    if (inputSize != outputSize) {
        throw InvalidArgumentException(
            std::string(funcName) + ": output size " + Detail::FormatValue(outputSize) +
            " does not match input size " + Detail::FormatValue(inputSize));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

#define CHROMA_REQUIRE_FINITE(val) \
    ::Chroma::Validate::RequireFinite(val, #val, __func__)

} // namespace Chroma::Validate
