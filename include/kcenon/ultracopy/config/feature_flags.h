// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for ultracopy
 *
 * Central entry point for feature detection. Include this header to get
 * the ULTRACOPY_HAS_* and KCENON_WITH_* feature macros.
 *
 * Feature categories:
 * - ULTRACOPY_HAS_*      : Local feature availability (zlib, LZ4)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/ultracopy/config/feature_flags.h>
 *
 * #if ULTRACOPY_HAS_LZ4
 *     options.format = archive_format::tar_lz4;
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define ULTRACOPY_HAS_COMMON_FEATURE_FLAGS 1
#else
#define ULTRACOPY_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// ultracopy Feature Flags
//==============================================================================

/**
 * @brief LZ4 frame support for tar.lz4 archives
 *
 * Set by CMake when built with ULTRACOPY_ENABLE_LZ4 (the default).
 */
#ifndef ULTRACOPY_HAS_LZ4
    #if defined(ULTRACOPY_ENABLE_LZ4)
        #define ULTRACOPY_HAS_LZ4 1
    #else
        #define ULTRACOPY_HAS_LZ4 0
    #endif
#endif

/**
 * @brief zlib is a hard dependency: zip members and tar.gz
 */
#ifndef ULTRACOPY_HAS_ZLIB
    #define ULTRACOPY_HAS_ZLIB 1
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

/**
 * @brief Whether log output is routed through logger_system
 */
#ifndef ULTRACOPY_WITH_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define ULTRACOPY_WITH_LOGGER_SYSTEM 1
    #else
        #define ULTRACOPY_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef ULTRACOPY_PRINT_FEATURE_SUMMARY

#pragma message("=== ultracopy Feature Summary ===")

#if ULTRACOPY_HAS_LZ4
    #pragma message("  LZ4 frames (tar.lz4): Enabled")
#else
    #pragma message("  LZ4 frames (tar.lz4): Disabled")
#endif

#if ULTRACOPY_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled")
#endif

#endif // ULTRACOPY_PRINT_FEATURE_SUMMARY
