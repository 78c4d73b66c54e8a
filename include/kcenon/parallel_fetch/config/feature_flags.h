// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for parallel_fetch
 *
 * Central entry point for integration flags. Include this header to get
 * access to the KCENON_WITH_* feature macros, which are inherited from
 * common_system when it is installed and derived from the BUILD_WITH_*
 * compile definitions otherwise.
 *
 * Usage:
 * @code
 * #include <kcenon/parallel_fetch/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto transport = make_network_http_transport();
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define PARALLEL_FETCH_HAS_COMMON_FEATURE_FLAGS 1
#else
#define PARALLEL_FETCH_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool for chunk fetches)
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

// network_system integration (HTTP/TLS transport)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Unified flag for logger_system usage in parallel_fetch
 *
 * logger_system requires common_system for its result types.
 */
#ifndef PARALLEL_FETCH_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define PARALLEL_FETCH_USE_LOGGER_SYSTEM 1
    #else
        #define PARALLEL_FETCH_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef PARALLEL_FETCH_PRINT_FEATURE_SUMMARY

#pragma message("=== parallel_fetch Feature Summary ===")

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system transport: Enabled")
#else
    #pragma message("  network_system transport: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system executor: Enabled")
#else
    #pragma message("  thread_system executor: Disabled")
#endif

#if PARALLEL_FETCH_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Enabled")
#else
    #pragma message("  logger_system: Disabled")
#endif

#endif  // PARALLEL_FETCH_PRINT_FEATURE_SUMMARY
