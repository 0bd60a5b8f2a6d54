// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_delta_config.h
/// @brief Centralized configuration for json_delta and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by json_delta:
///   - immer: Persistent containers backing Value
///   - lager: Lenses (pointer_lens)
///   - zug:   Functional composition used by lager lenses
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All json_delta public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_DELTA_CONFIGURED)
#error "immer headers were included before json_delta/json_delta_config.h. " \
       "Please include json_delta headers before any direct immer includes."
#endif

#define JSON_DELTA_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting enabled
///
/// Value uses immer::default_memory_policy. A single Value may be read
/// from many threads at once (diff, get_at), which copies boxes and so
/// touches reference counts. UnsafeValue opts out explicitly.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// Invalid transient use is a programming error, not an input error
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks
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
// When JSON_DELTA_VERBOSE_LOG is 1:
//   - pointer/patch decode failures and diff_json parse failures
//     are reported on stderr
//
// Default: enabled in debug builds, disabled when NDEBUG is set.
// ============================================================

#ifndef JSON_DELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSON_DELTA_VERBOSE_LOG 0
#  else
#    define JSON_DELTA_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSON_DELTA_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("json_delta/immer: Thread safety DISABLED")
#else
#pragma message("json_delta/immer: Thread safety ENABLED")
#endif

#if JSON_DELTA_VERBOSE_LOG
#pragma message("json_delta: verbose logging ENABLED")
#endif
#endif // JSON_DELTA_CONFIG_VERBOSE
