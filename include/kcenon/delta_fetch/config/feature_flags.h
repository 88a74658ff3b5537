// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for delta_fetch
 *
 * Central entry point for the optional kcenon ecosystem integrations.
 *
 * Feature categories:
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 * - DELTA_FETCH_USE_*    : Integrations actually enabled in this build
 *
 * Usage:
 * @code
 * #include <kcenon/delta_fetch/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = std::make_shared<thread_system_pool_adapter>(...);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define DELTA_FETCH_HAS_COMMON_FEATURE_FLAGS 1
#else
#define DELTA_FETCH_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool backend)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging backend)
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
 * @brief Unified flag for logger_system usage in delta_fetch
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef DELTA_FETCH_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DELTA_FETCH_USE_LOGGER_SYSTEM 1
    #else
        #define DELTA_FETCH_USE_LOGGER_SYSTEM 0
    #endif
#endif

#ifdef DELTA_FETCH_PRINT_FEATURE_SUMMARY

#pragma message("=== delta_fetch Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if DELTA_FETCH_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#endif // DELTA_FETCH_PRINT_FEATURE_SUMMARY
