/**
 * @file Platform.hpp
 * @brief Compile-time platform detection and branch-prediction hints.
 *
 * BtPad reads Linux event devices; other targets can still build the
 * mapping layer and the in-memory sources, which is what BTPAD_OS_LINUX
 * gates.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef BTPAD_CORE_PLATFORM_HPP
    #define BTPAD_CORE_PLATFORM_HPP

// ---- Operating System ----------------------------------------------------

    #if defined(__linux__)
        #define BTPAD_OS_LINUX   1
    #elif defined(_WIN32) || defined(_WIN64)
        #define BTPAD_OS_WINDOWS 1
    #elif defined(__APPLE__)
        #define BTPAD_OS_MACOS   1
    #else
        #define BTPAD_OS_UNKNOWN 1
    #endif

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define BTPAD_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define BTPAD_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define BTPAD_COMPILER_MSVC  1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(BTPAD_COMPILER_GCC) || defined(BTPAD_COMPILER_CLANG)
        #define BTPAD_LIKELY(x)     __builtin_expect(!!(x), 1)
        #define BTPAD_UNLIKELY(x)   __builtin_expect(!!(x), 0)
    #else
        #define BTPAD_LIKELY(x)     (x)
        #define BTPAD_UNLIKELY(x)   (x)
    #endif

#endif // BTPAD_CORE_PLATFORM_HPP
