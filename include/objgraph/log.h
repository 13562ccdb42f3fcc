// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers, gated by OBJGRAPH_VERBOSE_LOG.

#pragma once

#include "config.h"

#include <iostream>
#include <source_location>
#include <string_view>

namespace objgraph {

namespace detail {

inline void log_event(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OBJGRAPH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_name_event(
    std::string_view func,
    std::string_view name,
    std::string_view what,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OBJGRAPH_VERBOSE_LOG
    std::cerr << "[" << func << "] '" << name << "' " << what
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)name;
    (void)what;
    (void)loc;
#endif
}

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OBJGRAPH_VERBOSE_LOG
    std::cerr << "[" << func << "] error: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

} // namespace objgraph
