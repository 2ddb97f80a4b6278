// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file render_diff_config.h
/// @brief Centralized compile-time configuration for render_diff and its dependencies
///
/// This file defines the configuration of the third-party libraries used by
/// render_diff:
///   - immer: persistent containers backing Value and the render model
///   - lager: lenses used to read and write Value trees by path
///   - zug: function composition for lenses
///
/// It MUST be included before any library headers so every translation unit
/// sees the same settings. All render_diff public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(RENDER_DIFF_CONFIGURED)
#error "immer headers were included before render_diff/render_diff_config.h. " \
       "Please include render_diff headers before any direct immer includes."
#endif

#define RENDER_DIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep immer's atomic reference counting.
///
/// Render trees and Value snapshots are shared read-only between the
/// worker threads of ArchiveDiffer, so the refcounts must be atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// render_diff only uses lager's lenses, never its stores.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging
//
// When RENDER_DIFF_VERBOSE_LOG is non-zero:
//   - failed Value accesses, invalid pointers, failed patch operations
//     and diff diagnostics are written to stderr
//
// Enabled in debug builds and disabled in release builds by default.
//
// To explicitly enable: #define RENDER_DIFF_VERBOSE_LOG 1
// To explicitly disable: #define RENDER_DIFF_VERBOSE_LOG 0
// ============================================================

#ifndef RENDER_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define RENDER_DIFF_VERBOSE_LOG 0
#  else
#    define RENDER_DIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef RENDER_DIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("render_diff: immer thread safety DISABLED")
#else
#pragma message("render_diff: immer thread safety ENABLED")
#endif

#if RENDER_DIFF_VERBOSE_LOG
#pragma message("render_diff: verbose logging ENABLED")
#endif
#endif // RENDER_DIFF_CONFIG_VERBOSE
