// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_proxy.h
/// @brief Lazy, mutable, resizable view of one array leaf in an open store.
///
/// An ArrayProxy copies nothing when it is created: every read and write
/// goes to the file through the owning Session. The proxy stays valid while
/// the session is open; afterwards every operation throws StorageError.
///
/// Only the leading axis can change size. Writing past its end grows it, and
/// rows created by the growth read back as 0 until written.
///
/// Usage:
/// @code
///   Session s("run.h5", FileMode::read_write);
///   ArrayProxy samples = s.array("/samples");
///
///   NdArray head = samples.read(Slice{0, 10});
///   samples.append(NdArray::from<double>({1.0, 2.0}));
///   samples.write(20, NdArray::scalar(3.0));   // grows to 21 rows
/// @endcode

#pragma once

#include "api.h"
#include "ndarray.h"
#include "object.h"

#include <cstddef>
#include <memory>
#include <string>

namespace objgraph {

namespace detail {
struct FileState;
} // namespace detail

/// Half-open range [start, stop) along the leading axis
struct Slice {
    std::size_t start = 0;
    std::size_t stop = 0;

    [[nodiscard]] std::size_t length() const noexcept { return stop > start ? stop - start : 0; }
};

class OBJGRAPH_API ArrayProxy {
public:
    /// Bind to the array leaf at `path` (created by Session::array / lazy load)
    ArrayProxy(std::shared_ptr<detail::FileState> file, std::string path);

    // ============================================================
    // Reads
    // ============================================================

    /// Whole array (proxy[:])
    [[nodiscard]] NdArray read() const;

    /// One row along the leading axis (shape = shape()[1:])
    [[nodiscard]] NdArray read(std::size_t index) const;

    /// Rows [start, stop) along the leading axis
    [[nodiscard]] NdArray read(Slice slice) const;

    // ============================================================
    // Writes
    // ============================================================

    /// Overwrite one row; grows the leading axis when index >= shape()[0]
    void write(std::size_t index, const NdArray& row);

    /// Overwrite rows [start, stop); block shape must be {stop-start, shape()[1:]...}
    void write(Slice slice, const NdArray& block);

    /// Replace the contents (proxy[:] = array); grows but never shrinks the leading axis
    void assign(const NdArray& array);

    /// Add rows at the end; `rows` is either one row or a block of rows
    void append(const NdArray& rows);

    /// Set the leading extent; new rows read as 0
    void resize(std::size_t leading_extent);

    // ============================================================
    // Metadata
    // ============================================================

    [[nodiscard]] Shape shape() const;
    [[nodiscard]] DType dtype() const;
    [[nodiscard]] std::size_t ndim() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t nbytes() const;

    /// Attributes of the leaf (dataset kind and metadata), decoded
    [[nodiscard]] Dict attrs() const;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool read_only() const;

private:
    std::shared_ptr<detail::FileState> file_;
    std::string path_;
};

} // namespace objgraph
