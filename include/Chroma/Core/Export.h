#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - CHROMA_BUILD_SHARED: when building Chroma as shared library
 *   - CHROMA_USE_SHARED: when using Chroma as shared library
 *   - CHROMA_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CHROMA_BUILD_SHARED)
        #define CHROMA_API __declspec(dllexport)
    #elif defined(CHROMA_USE_SHARED)
        #define CHROMA_API __declspec(dllimport)
    #else
        #define CHROMA_API
    #endif
#else
    #if defined(CHROMA_BUILD_SHARED)
        #define CHROMA_API __attribute__((visibility("default")))
    #else
        #define CHROMA_API
    #endif
#endif
