// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file h5_file.h
/// @brief Private HDF5 plumbing shared by store.cpp and array_proxy.cpp.
///
/// Not installed. Holds the open-file state that a Session and its
/// ArrayProxy handles share, and the attribute codec of the store layout.

#pragma once

#include <objgraph/config.h>
#include <objgraph/errors.h>
#include <objgraph/ndarray.h>
#include <objgraph/store.h>
#include <objgraph/value.h>

#include <H5Cpp.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace objgraph::detail {

/// Node key that marks a lazily loaded array leaf (consumed by the load hook)
inline constexpr const char* leaf_key = "__leaf__";

/// Name of the child or attribute that holds a root without a group form
inline constexpr const char* root_key = "__root__";

/// State of one open store file, shared by a Session and its proxies
struct FileState {
    H5::H5File file;
    std::filesystem::path path;
    FileMode mode = FileMode::read_only;
    StoreOptions options;
    bool open = false;
};

/// @throws StorageError when the session owning `state` has been closed
void require_open(const FileState& state, std::string_view operation);

/// require_open(), and ReadOnlyError when the file was opened read-only
void require_writable(const FileState& state, std::string_view operation);

/// Run `fn`, rethrowing HDF5 failures as StorageError(context: detail)
template <typename Fn>
auto guard_h5(const std::string& context, Fn&& fn) -> decltype(fn())
{
    try {
        return fn();
    } catch (const H5::Exception& e) {
        throw StorageError(context + ": " + e.getDetailMsg());
    }
}

// ============================================================
// Element types
// ============================================================

[[nodiscard]] const H5::PredType& h5_type_of(DType dtype);

/// DType of a stored leaf
/// @throws StorageError for non-numeric element types
[[nodiscard]] DType dtype_of_leaf(const H5::DataSet& leaf);

[[nodiscard]] Shape shape_of_leaf(const H5::DataSet& leaf);

// ============================================================
// Attributes
// ============================================================

/// Write (or overwrite) a scalar node as an attribute of `target`.
///
/// `value` is a scalar Value or a {__primitive__, value} node; anything
/// else throws StorageError.
void write_attribute(H5::H5Object& target, const std::string& name, const Value& value);

/// Decode an attribute back into its nested Value form
[[nodiscard]] Value read_attribute(const H5::Attribute& attr);

/// Open the group or leaf at an absolute path and call fn(H5::H5Object&)
template <typename Fn>
void with_node(H5::H5File& file, const std::string& node_path, Fn&& fn)
{
    if (node_path.empty() || node_path == "/") {
        H5::Group root = file.openGroup("/");
        fn(static_cast<H5::H5Object&>(root));
        return;
    }
    if (file.childObjType(node_path) == H5O_TYPE_DATASET) {
        H5::DataSet leaf = file.openDataSet(node_path);
        fn(static_cast<H5::H5Object&>(leaf));
    } else {
        H5::Group group = file.openGroup(node_path);
        fn(static_cast<H5::H5Object&>(group));
    }
}

} // namespace objgraph::detail
