// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_edit_config.h
/// @brief Centralized configuration for json_edit and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by json_edit:
///   - immer: Persistent containers backing the Value tree
///   - lager: Store used by the edit session
///   - zug:   Transducers (pulled in by lager)
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All json_edit public headers already include this file.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_EDIT_CONFIGURED)
#error "immer headers were included before json_edit/json_edit_config.h. " \
       "Please include json_edit headers before any direct immer includes."
#endif

#define JSON_EDIT_CONFIGURED 1

// ============================================================
// json_edit Feature Toggles
// ============================================================

/// @brief Log path/parse failures to stderr
///
/// Enabled in debug builds, disabled when NDEBUG is defined.
#ifndef JSON_EDIT_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSON_EDIT_VERBOSE_LOG 0
#  else
#    define JSON_EDIT_VERBOSE_LOG 1
#  endif
#endif

/// @brief Spaces per nesting level in pretty-printed JSON output
#ifndef JSON_EDIT_INDENT_WIDTH
#define JSON_EDIT_INDENT_WIDTH 2
#endif

/// @brief Deepest container nesting from_json accepts
///
/// Deeper text is rejected as malformed. Output is not limited, so an update
/// that nests past this depth writes text that no longer parses.
#ifndef JSON_EDIT_MAX_DEPTH
#define JSON_EDIT_MAX_DEPTH 512
#endif

/// @brief Most null slots an update may append to an array to reach an index
///
/// An index further past the end fails with PathError::IndexTooLarge.
#ifndef JSON_EDIT_MAX_ARRAY_PADDING
#define JSON_EDIT_MAX_ARRAY_PADDING 65536
#endif

// ============================================================
// Immer Performance Optimization Settings
// ============================================================

/// @brief Disable thread safety for single-threaded performance
///
/// Every json_edit operation runs on the caller's thread and the document is
/// rebuilt on each call, so the default Value never crosses threads.
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

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

// ============================================================
// Immer Error Handling Settings
// ============================================================

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
///
/// The edit session store has no dependencies, so the checks only cost
/// compile time.
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
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSON_EDIT_CONFIG_VERBOSE
#pragma message("json_edit: Thread safety DISABLED (optimized for single-thread)")

#if JSON_EDIT_VERBOSE_LOG
#pragma message("json_edit: Verbose logging ENABLED")
#endif
#endif // JSON_EDIT_CONFIG_VERBOSE
