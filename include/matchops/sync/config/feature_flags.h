// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for matchops_sync
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - KCENON_WITH_*            : kcenon ecosystem integration flags
 * - MATCHOPS_SYNC_USE_*      : Derived integration switches
 *
 * All flags are driven by compile definitions set from CMake options.
 *
 * @code
 * #include <matchops/sync/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = adapters::thread_system_task_pool::create_default(1);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// System Integration Flags
//==============================================================================

// common_system integration (Result types shared by logger_system)
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (worker pool for the migration batch loop)
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
 * @brief Unified flag for logger_system usage in matchops_sync
 *
 * logger_system requires common_system; both must be enabled.
 */
#ifndef MATCHOPS_SYNC_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define MATCHOPS_SYNC_USE_LOGGER_SYSTEM 1
    #else
        #define MATCHOPS_SYNC_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef MATCHOPS_SYNC_PRINT_FEATURE_SUMMARY

#pragma message("=== matchops_sync Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("=====================================")

#endif // MATCHOPS_SYNC_PRINT_FEATURE_SUMMARY
