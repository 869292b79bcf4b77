// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file treepatch_config.h
/// @brief Centralized configuration for treepatch and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by treepatch:
///   - immer: Immutable data structures (Value containers)
///   - lager / zug: Lenses over Value trees (pointer_lens.h)
///
/// It also holds treepatch's own knobs (recursion guard, verbose logging).
///
/// It MUST be included before any library headers to ensure consistent settings.
///
/// @warning Do NOT include immer headers directly without including this file first.
///          All treepatch public headers already include this file, so users
///          who only use treepatch headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================
// Ensure this file is included before any library headers

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(TREEPATCH_CONFIGURED)
#error "immer headers were included before treepatch/treepatch_config.h. " \
       "Please include treepatch headers before any direct immer includes."
#endif

#define TREEPATCH_CONFIGURED 1

// ============================================================
// Immer Performance Optimization Settings
// ============================================================

/// @brief Disable thread safety for single-threaded performance
///
/// The diff/patch engine is fully synchronous and never shares a Value tree
/// across threads, so non-atomic reference counting is sufficient.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// ============================================================
// Immer Debug Settings (all disabled for performance)
// ============================================================

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
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Recursion Guard
// ============================================================

/// @brief Maximum nesting depth accepted by every recursive walk
///
/// Applies to:
/// - pointer length (number of tokens) in patch/get
/// - document depth in the singleton collapse pass of compatibility mode
/// - document depth in diff (deeper subtrees are replaced as a whole)
/// - nesting depth accepted by the JSON parser
///
/// Exceeding it in patch() or get() reports PatchErrorCode::DepthLimitExceeded.
#ifndef TREEPATCH_MAX_DEPTH
#define TREEPATCH_MAX_DEPTH 512
#endif

// ============================================================
// Verbose Logging
//
// When TREEPATCH_VERBOSE_LOG is 1, failed patch/get calls and JSON
// parse errors are reported on stderr (see detail::log_* in value.h).
//
// By default, verbose logging is DISABLED in release builds
// and ENABLED in debug builds.
// ============================================================

#ifndef TREEPATCH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define TREEPATCH_VERBOSE_LOG 0
#  else
#    define TREEPATCH_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef TREEPATCH_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("treepatch: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("treepatch: Thread safety ENABLED")
#endif
#endif // TREEPATCH_CONFIG_VERBOSE
