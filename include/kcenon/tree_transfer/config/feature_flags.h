// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for tree_transfer
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - TREE_TRANS_HAS_*  : Local feature availability (POSIX permissions)
 * - KCENON_WITH_*     : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/tree_transfer/config/feature_flags.h>
 *
 * #if TREE_TRANS_HAS_UNIX_PERMISSIONS
 *     ::chmod(path.c_str(), mode);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define TREE_TRANS_HAS_COMMON_FEATURE_FLAGS 1
#else
#define TREE_TRANS_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Tree Transfer Feature Flags
//==============================================================================

/**
 * @brief Unix permission support
 *
 * When enabled, received files and directories get the source permission
 * triple re-applied on the local side.
 */
#ifndef TREE_TRANS_HAS_UNIX_PERMISSIONS
    #if defined(__unix__) || defined(__APPLE__)
        #define TREE_TRANS_HAS_UNIX_PERMISSIONS 1
    #else
        #define TREE_TRANS_HAS_UNIX_PERMISSIONS 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration
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

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in tree_transfer
 *
 * logger_system requires common_system; both must be enabled.
 */
#ifndef TREE_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define TREE_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define TREE_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef TREE_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== Tree Transfer Feature Summary ===")

#if TREE_TRANS_HAS_UNIX_PERMISSIONS
    #pragma message("  Unix permissions: Enabled")
#else
    #pragma message("  Unix permissions: Disabled")
#endif

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if TREE_TRANSFER_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=====================================")

#endif // TREE_TRANS_PRINT_FEATURE_SUMMARY
