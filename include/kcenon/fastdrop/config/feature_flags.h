// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for fastdrop
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - FASTDROP_HAS_*   : Local feature availability (OpenSSL)
 * - KCENON_WITH_*    : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/fastdrop/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = adapters::thread_system_worker_pool::create_default();
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define FASTDROP_HAS_COMMON_FEATURE_FLAGS 1
#else
#define FASTDROP_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// fastdrop Feature Flags
//==============================================================================

/**
 * @brief OpenSSL support
 *
 * SHA-256 file digests, HMAC ticket authentication and nonce generation all
 * go through OpenSSL. The build always links it; the macro exists so that
 * headers can report it in the feature summary.
 */
#ifndef FASTDROP_HAS_OPENSSL
    #if defined(FASTDROP_WITH_OPENSSL)
        #define FASTDROP_HAS_OPENSSL 1
    #else
        #define FASTDROP_HAS_OPENSSL 0
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

// thread_system integration (worker pool for sender sessions)
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

// network_system integration (shared basic_thread_pool)
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
 * @brief Unified flag for logger_system usage in fastdrop
 *
 * logger_system needs common_system for its result types, so both must be
 * enabled before records are forwarded to it.
 */
#ifndef FASTDROP_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define FASTDROP_USE_LOGGER_SYSTEM 1
    #else
        #define FASTDROP_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef FASTDROP_PRINT_FEATURE_SUMMARY

#pragma message("=== fastdrop Feature Summary ===")

#if FASTDROP_HAS_OPENSSL
    #pragma message("  OpenSSL: Enabled")
#else
    #pragma message("  OpenSSL: Not reported")
#endif

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

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("================================")

#endif // FASTDROP_PRINT_FEATURE_SUMMARY
