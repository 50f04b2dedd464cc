/**
 * @file export.hpp
 * @brief Symbol visibility macros for the netmap_utils shared library.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(NETMAP_UTILS_BUILD)
        #define NETMAP_UTILS_API __declspec(dllexport)
    #else
        #define NETMAP_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(NETMAP_UTILS_BUILD)
        #define NETMAP_UTILS_API __attribute__((visibility("default")))
    #else
        #define NETMAP_UTILS_API
    #endif
#else
    #define NETMAP_UTILS_API
#endif
