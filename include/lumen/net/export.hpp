/**
 * @file export.hpp
 * @brief Symbol visibility macros for lumen_net shared library.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LUMEN_NET_BUILD)
        #define LUMEN_NET_API __declspec(dllexport)
    #else
        #define LUMEN_NET_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LUMEN_NET_BUILD)
        #define LUMEN_NET_API __attribute__((visibility("default")))
    #else
        #define LUMEN_NET_API
    #endif
#else
    #define LUMEN_NET_API
#endif
