// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for vfs_transfer_system
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - VFS_TRANS_*     : Local build settings (package channel, logger usage)
 * - KCENON_WITH_*   : System integration flags (inherited from common_system)
 *
 * @code
 * #include <kcenon/vfs_transfer/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_worker_pool::create_default(jobs);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
#endif

//==============================================================================
// vfs_transfer_system settings
//==============================================================================

/**
 * @brief Packaging channel the library was distributed through
 *
 * Selects the installation hint reported when a backend's dependencies are
 * missing. Set via the CMake cache variable VFS_TRANS_PACKAGE_CHANNEL
 * ("apt", "conda", "vcpkg"); empty when unknown.
 */
#ifndef VFS_TRANS_PACKAGE_CHANNEL
    #define VFS_TRANS_PACKAGE_CHANNEL ""
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

// thread_system integration (worker pool for directory transfers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
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
 * @brief Unified flag for logger_system usage in vfs_transfer
 *
 * logger_system requires common_system for its result types.
 */
#ifndef VFS_TRANS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define VFS_TRANS_USE_LOGGER_SYSTEM 1
    #else
        #define VFS_TRANS_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef VFS_TRANS_PRINT_FEATURE_SUMMARY

#pragma message("=== VFS Transfer System Feature Summary ===")

#if KCENON_WITH_COMMON_SYSTEM
    #pragma message("  common_system: Available")
#else
    #pragma message("  common_system: Not Available")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("============================================")

#endif // VFS_TRANS_PRINT_FEATURE_SUMMARY
