// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Centralized configuration for objgraph and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by objgraph:
///   - immer: Immutable containers behind Value
///   - boost: date_time (timestamps) and core (demangling)
///   - HDF5: defaults for the hierarchical store
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All objgraph public headers already include this file.
///
/// objgraph is single-threaded by design: the type registry has no locking
/// and the Value containers use non-atomic reference counts.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OBJGRAPH_CONFIGURED)
#error "immer headers were included before objgraph/config.h. " \
       "Please include objgraph headers before any direct immer includes."
#endif

#define OBJGRAPH_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable thread safety (non-atomic refcount, no locks)
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
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
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for date_time (MSVC)
///
/// Only the header-only boost::posix_time types are used.
#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB 1
#endif

#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When OBJGRAPH_VERBOSE_LOG is 1 the detail::log_* helpers write to
// stderr (registry overwrites, skipped slots, session lifecycle).
// Disabled in release builds by default.
// ============================================================

#ifndef OBJGRAPH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define OBJGRAPH_VERBOSE_LOG 0
#  else
#    define OBJGRAPH_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// HDF5 Store Defaults
// ============================================================

/// @brief Chunk length along the leading (resizable) axis of array leaves
///
/// Every array leaf with at least one dimension is created chunked with an
/// unlimited leading axis so that ArrayProxy can grow it in place.
/// Override at runtime with StoreOptions::chunk_rows.
#ifndef OBJGRAPH_H5_CHUNK_ROWS
#define OBJGRAPH_H5_CHUNK_ROWS 1024
#endif

/// @brief Deflate (gzip) level for array leaves, 0 disables the filter
#ifndef OBJGRAPH_H5_DEFLATE_LEVEL
#define OBJGRAPH_H5_DEFLATE_LEVEL 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef OBJGRAPH_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("objgraph: Thread safety DISABLED (optimized for single-thread)")
#endif
#if OBJGRAPH_VERBOSE_LOG
#pragma message("objgraph: Verbose logging ENABLED")
#endif
#if OBJGRAPH_H5_DEFLATE_LEVEL > 0
#pragma message("objgraph: Deflate compression ENABLED for array leaves")
#endif
#endif
