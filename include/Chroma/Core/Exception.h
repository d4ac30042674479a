#pragma once

#include <Chroma/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for Chroma
 *
 * Only construction from external input can fail (hue degrees, hex text).
 * Every conversion between color spaces is total and never throws.
 */

#include <stdexcept>
#include <string>

namespace Chroma {

/**
 * @brief Base exception class for Chroma
 */
class CHROMA_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception (NaN input, mismatched buffer sizes)
 */
class CHROMA_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class CHROMA_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief Malformed textual color representation
 */
class CHROMA_API FormatException : public Exception {
public:
    explicit FormatException(const std::string& message)
        : Exception("Format error: " + message) {}
};

} // namespace Chroma
