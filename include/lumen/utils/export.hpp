/**
 * @file export.hpp
 * @brief Symbol visibility macros for lumen_utils shared library.
 *
 * This header provides the LUMEN_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    // Windows platform
    #if defined(LUMEN_UTILS_BUILD)
        // Building the library - export symbols
        #define LUMEN_UTILS_API __declspec(dllexport)
    #else
        // Using the library - import symbols
        #define LUMEN_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang on Unix-like systems
    #if defined(LUMEN_UTILS_BUILD)
        #define LUMEN_UTILS_API __attribute__((visibility("default")))
    #else
        #define LUMEN_UTILS_API
    #endif
#else
    // Unknown compiler - no special handling
    #define LUMEN_UTILS_API
#endif
