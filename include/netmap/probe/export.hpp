/**
 * @file export.hpp
 * @brief Symbol visibility macros for the netmap_probe shared library.
 *
 * @copyright Copyright (c) 2024 NetMap Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(NETMAP_PROBE_BUILD)
        #define NETMAP_PROBE_API __declspec(dllexport)
    #else
        #define NETMAP_PROBE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(NETMAP_PROBE_BUILD)
        #define NETMAP_PROBE_API __attribute__((visibility("default")))
    #else
        #define NETMAP_PROBE_API
    #endif
#else
    #define NETMAP_PROBE_API
#endif
