// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for deck_bridge
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - DECK_BRIDGE_HAS_*    : Local feature availability (libssh2 backend)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/deck_bridge/config/feature_flags.h>
 *
 * #if DECK_BRIDGE_HAS_LIBSSH2
 *     auto connector = std::make_shared<sftp_connector>();
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
#define DECK_BRIDGE_HAS_COMMON_FEATURE_FLAGS 1
#else
#define DECK_BRIDGE_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// deck_bridge Feature Flags
//==============================================================================

/**
 * @brief SFTP backend (libssh2)
 *
 * When enabled, sftp_channel and sftp_connector are compiled.
 * Set via CMake option DECK_BRIDGE_ENABLE_SFTP when libssh2 is found.
 */
#ifndef DECK_BRIDGE_HAS_LIBSSH2
    #if defined(DECK_BRIDGE_ENABLE_SFTP)
        #define DECK_BRIDGE_HAS_LIBSSH2 1
    #else
        #define DECK_BRIDGE_HAS_LIBSSH2 0
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

// thread_system integration (probe and supervisor pools)
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
 * @brief Unified flag for logger_system usage in deck_bridge
 *
 * logger_system needs common_system for its result and interface types.
 */
#ifndef DECK_BRIDGE_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DECK_BRIDGE_USE_LOGGER_SYSTEM 1
    #else
        #define DECK_BRIDGE_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef DECK_BRIDGE_PRINT_FEATURE_SUMMARY

#pragma message("=== deck_bridge Feature Summary ===")

#if DECK_BRIDGE_HAS_LIBSSH2
    #pragma message("  SFTP backend (libssh2): Enabled")
#else
    #pragma message("  SFTP backend (libssh2): Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if DECK_BRIDGE_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#pragma message("===================================")

#endif // DECK_BRIDGE_PRINT_FEATURE_SUMMARY
