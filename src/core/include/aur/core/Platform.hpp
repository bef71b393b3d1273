/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-prediction / inlining macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_PLATFORM_HPP
    #define AUR_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define AUR_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define AUR_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define AUR_COMPILER_MSVC  1
    #else
        #define AUR_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(AUR_COMPILER_GCC) || defined(AUR_COMPILER_CLANG)
        #define AUR_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define AUR_UNLIKELY(x)     (x)
    #endif

#endif // AUR_CORE_PLATFORM_HPP
