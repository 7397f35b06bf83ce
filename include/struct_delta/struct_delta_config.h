// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file struct_delta_config.h
/// @brief Compile-time configuration for struct_delta and its dependencies
///
/// Third-party libraries configured here:
///   - immer: backing store of the read-only (frozen) sequences and maps
///   - boost: date_time, multiprecision, uuid, algorithm/string
///
/// Every struct_delta public header includes this file first, so users who
/// only include struct_delta headers get consistent settings for free.
///
/// @warning Include struct_delta headers before any direct immer include.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(STRUCT_DELTA_CONFIGURED)
#error "immer headers were included before struct_delta/struct_delta_config.h. " \
       "Please include struct_delta headers before any direct immer includes."
#endif

#define STRUCT_DELTA_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep immer's atomic reference counting
///
/// Frozen collections may be compared from several threads at once (each
/// thread with its own ComparisonContext), so the refcount must stay atomic.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions (smaller nodes)
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
// Boost Library Configuration
// ============================================================

/// @brief Disable MSVC auto-linking of boost_date_time
///
/// Only header-only posix_time features are used (ptime arithmetic and
/// to_simple_string).
#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB 1
#endif

/// @brief Disable MSVC auto-linking for every boost library
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When STRUCT_DELTA_VERBOSE_LOG is non-zero, lookups that miss (member names,
// registry overrides) and apply/decode failures are logged to stderr before
// they are reported to the caller.
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef STRUCT_DELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define STRUCT_DELTA_VERBOSE_LOG 0
#  else
#    define STRUCT_DELTA_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Codec Defaults
// ============================================================

/// @brief Strings at least this long always go to the string table
#ifndef STRUCT_DELTA_STRING_TABLE_MIN_BYTES
#define STRUCT_DELTA_STRING_TABLE_MIN_BYTES 8
#endif

#ifdef STRUCT_DELTA_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("struct_delta: immer thread safety DISABLED")
#else
#pragma message("struct_delta: immer thread safety ENABLED")
#endif

#if STRUCT_DELTA_VERBOSE_LOG
#pragma message("struct_delta: verbose logging ENABLED")
#endif
#endif // STRUCT_DELTA_CONFIG_VERBOSE
