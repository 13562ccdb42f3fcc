// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform shared library export/import macros for objgraph.
///
/// Usage:
/// - When building objgraph as a SHARED library:
///   - CMake defines OBJGRAPH_EXPORTS (private) and OBJGRAPH_SHARED (public)
///   - Functions/classes marked with OBJGRAPH_API will be exported
///
/// - When using objgraph as a SHARED library:
///   - Link against the objgraph target (CMake propagates OBJGRAPH_SHARED)
///
/// - When building/using as a STATIC library:
///   - No macros defined, OBJGRAPH_API expands to nothing
///
/// Example:
/// @code
/// class OBJGRAPH_API CompositeType { ... };
/// OBJGRAPH_API Object load(const std::filesystem::path& source);
/// @endcode

#pragma once

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OBJGRAPH_SHARED
        #ifdef OBJGRAPH_EXPORTS
            #define OBJGRAPH_API __declspec(dllexport)
        #else
            #define OBJGRAPH_API __declspec(dllimport)
        #endif
    #else
        #define OBJGRAPH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OBJGRAPH_SHARED) && defined(OBJGRAPH_EXPORTS)
        #define OBJGRAPH_API __attribute__((visibility("default")))
    #else
        #define OBJGRAPH_API
    #endif
#else
    #define OBJGRAPH_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  OBJGRAPH_EXTERN_TEMPLATE struct BasicValue<...>;
// Usage in source:  template struct BasicValue<...>;

#define OBJGRAPH_EXTERN_TEMPLATE extern template
