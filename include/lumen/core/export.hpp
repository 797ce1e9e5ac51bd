/**
 * @file export.hpp
 * @brief Symbol visibility macros for lumen_core shared library.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LUMEN_CORE_BUILD)
        #define LUMEN_CORE_API __declspec(dllexport)
    #else
        #define LUMEN_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LUMEN_CORE_BUILD)
        #define LUMEN_CORE_API __attribute__((visibility("default")))
    #else
        #define LUMEN_CORE_API
    #endif
#else
    #define LUMEN_CORE_API
#endif
