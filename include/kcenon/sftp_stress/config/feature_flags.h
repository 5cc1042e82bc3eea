// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for sftp_stress
 *
 * Central entry point for the KCENON_WITH_* ecosystem integration flags.
 * LZ4, OpenSSL and libssh2 are hard requirements and have no flag.
 *
 * Usage:
 * @code
 * #include <kcenon/sftp_stress/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = thread_system_worker_pool::create_default(workers);
 * #endif
 * @endcode
 *
 * @see common_system/config/feature_flags.h for upstream feature detection
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if defined(BUILD_WITH_COMMON_SYSTEM)
#include <kcenon/common/config/feature_flags.h>
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

// thread_system integration (worker pool for transfer workers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (asynchronous console output)
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
 * @brief Unified flag for logger_system usage in stress_logger
 *
 * logger_system requires common_system for its result types.
 */
#ifndef SFTP_STRESS_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define SFTP_STRESS_USE_LOGGER_SYSTEM 1
    #else
        #define SFTP_STRESS_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef SFTP_STRESS_PRINT_FEATURE_SUMMARY

#pragma message("=== SFTP Stress Feature Summary ===")

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

#if SFTP_STRESS_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("===================================")

#endif // SFTP_STRESS_PRINT_FEATURE_SUMMARY
