// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_proxy.cpp
/// @brief ArrayProxy: hyperslab reads and writes on a chunked HDF5 leaf

#include "h5_file.h"

#include <objgraph/array_proxy.h>
#include <objgraph/builders.h>
#include <objgraph/graph.h>

#include <vector>

namespace objgraph {

namespace {

using detail::guard_h5;

Shape trailing_of(const Shape& shape)
{
    return shape.empty() ? Shape{} : Shape(shape.begin() + 1, shape.end());
}

std::vector<hsize_t> to_hsize(const Shape& shape)
{
    return std::vector<hsize_t>(shape.begin(), shape.end());
}

} // anonymous namespace

ArrayProxy::ArrayProxy(std::shared_ptr<detail::FileState> file, std::string path)
    : file_(std::move(file))
    , path_(std::move(path))
{
}

// ============================================================
// Internal helpers
//
// Each operation reopens the leaf: the proxy holds no HDF5 handle, so a
// closed session invalidates it without any bookkeeping.
// ============================================================

namespace {

struct Leaf {
    H5::DataSet dataset;
    Shape shape;
    DType dtype;
};

Leaf open_leaf(detail::FileState& file, const std::string& path)
{
    Leaf leaf;
    leaf.dataset = file.file.openDataSet(path);
    leaf.shape = detail::shape_of_leaf(leaf.dataset);
    leaf.dtype = detail::dtype_of_leaf(leaf.dataset);
    return leaf;
}

void require_rows(const Leaf& leaf, const std::string& path, const char* operation)
{
    if (leaf.shape.empty()) {
        throw StorageShapeError(std::string(operation) + ": leaf '" + path + "' is 0-d and has no rows");
    }
}

NdArray read_rows(const Leaf& leaf, std::size_t start, std::size_t count)
{
    Shape out_shape = leaf.shape;
    out_shape[0] = count;
    NdArray result(leaf.dtype, out_shape);
    if (result.size() == 0) return result;

    std::vector<hsize_t> offset(leaf.shape.size(), 0);
    offset[0] = start;
    std::vector<hsize_t> counts = to_hsize(out_shape);

    H5::DataSpace file_space = leaf.dataset.getSpace();
    file_space.selectHyperslab(H5S_SELECT_SET, counts.data(), offset.data());
    H5::DataSpace mem_space(static_cast<int>(counts.size()), counts.data());
    leaf.dataset.read(result.data(), detail::h5_type_of(leaf.dtype), mem_space, file_space);
    return result;
}

/// Write `block` (shape {k, trailing...}) at rows [start, start+k),
/// growing the leading axis first when needed
void write_rows(Leaf& leaf, std::size_t start, const NdArray& block)
{
    const std::size_t count = block.shape()[0];
    const std::size_t stop = start + count;
    if (stop > leaf.shape[0]) {
        std::vector<hsize_t> dims = to_hsize(leaf.shape);
        dims[0] = stop;
        leaf.dataset.extend(dims.data());
        leaf.shape[0] = stop;
    }
    if (block.size() == 0) return;

    const NdArray converted = block.dtype() == leaf.dtype ? block : block.astype(leaf.dtype);

    std::vector<hsize_t> offset(leaf.shape.size(), 0);
    offset[0] = start;
    std::vector<hsize_t> counts = to_hsize(converted.shape());

    H5::DataSpace file_space = leaf.dataset.getSpace();
    file_space.selectHyperslab(H5S_SELECT_SET, counts.data(), offset.data());
    H5::DataSpace mem_space(static_cast<int>(counts.size()), counts.data());
    leaf.dataset.write(converted.data(), detail::h5_type_of(leaf.dtype), mem_space, file_space);
}

} // anonymous namespace

// ============================================================
// Reads
// ============================================================

NdArray ArrayProxy::read() const
{
    detail::require_open(*file_, "ArrayProxy::read");
    return guard_h5("cannot read '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        NdArray result(leaf.dtype, leaf.shape);
        if (result.size() > 0) {
            leaf.dataset.read(result.data(), detail::h5_type_of(leaf.dtype));
        }
        return result;
    });
}

NdArray ArrayProxy::read(std::size_t index) const
{
    detail::require_open(*file_, "ArrayProxy::read");
    return guard_h5("cannot read '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::read");
        if (index >= leaf.shape[0]) {
            throw StorageShapeError("ArrayProxy::read: index " + std::to_string(index) +
                                    " is out of range for '" + path_ + "' of shape " +
                                    shape_to_string(leaf.shape));
        }
        return read_rows(leaf, index, 1).reshaped(trailing_of(leaf.shape));
    });
}

NdArray ArrayProxy::read(Slice slice) const
{
    detail::require_open(*file_, "ArrayProxy::read");
    return guard_h5("cannot read '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::read");
        if (slice.stop > leaf.shape[0]) {
            throw StorageShapeError("ArrayProxy::read: slice [" + std::to_string(slice.start) + ", " +
                                    std::to_string(slice.stop) + ") exceeds '" + path_ +
                                    "' of shape " + shape_to_string(leaf.shape));
        }
        return read_rows(leaf, slice.start, slice.length());
    });
}

// ============================================================
// Writes
// ============================================================

void ArrayProxy::write(std::size_t index, const NdArray& row)
{
    detail::require_writable(*file_, "ArrayProxy::write");
    guard_h5("cannot write '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::write");

        Shape trailing = trailing_of(leaf.shape);
        if (row.shape() != trailing) {
            throw StorageShapeError("ArrayProxy::write: row of shape " + shape_to_string(row.shape()) +
                                    " does not match rows of '" + path_ + "' (" +
                                    shape_to_string(trailing) + ")");
        }
        trailing.insert(trailing.begin(), 1);
        write_rows(leaf, index, row.reshaped(std::move(trailing)));
    });
}

void ArrayProxy::write(Slice slice, const NdArray& block)
{
    detail::require_writable(*file_, "ArrayProxy::write");
    guard_h5("cannot write '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::write");

        Shape expected = trailing_of(leaf.shape);
        expected.insert(expected.begin(), slice.length());
        if (block.shape() != expected) {
            throw StorageShapeError("ArrayProxy::write: block of shape " + shape_to_string(block.shape()) +
                                    " does not fit slice of '" + path_ + "' (expected " +
                                    shape_to_string(expected) + ")");
        }
        write_rows(leaf, slice.start, block);
    });
}

void ArrayProxy::assign(const NdArray& array)
{
    detail::require_writable(*file_, "ArrayProxy::assign");
    guard_h5("cannot write '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);

        if (leaf.shape.empty()) {
            if (array.size() != 1) {
                throw StorageShapeError("ArrayProxy::assign: 0-d leaf '" + path_ +
                                        "' cannot hold shape " + shape_to_string(array.shape()));
            }
            const NdArray converted = array.dtype() == leaf.dtype ? array : array.astype(leaf.dtype);
            leaf.dataset.write(converted.data(), detail::h5_type_of(leaf.dtype));
            return;
        }

        if (array.ndim() != leaf.shape.size() || trailing_of(array.shape()) != trailing_of(leaf.shape)) {
            throw StorageShapeError("ArrayProxy::assign: shape " + shape_to_string(array.shape()) +
                                    " does not match '" + path_ + "' of shape " +
                                    shape_to_string(leaf.shape));
        }
        if (array.shape()[0] < leaf.shape[0]) {
            throw StorageShapeError("ArrayProxy::assign: " + std::to_string(array.shape()[0]) +
                                    " rows cannot replace the " + std::to_string(leaf.shape[0]) +
                                    " rows of '" + path_ + "' (use resize to shrink)");
        }
        write_rows(leaf, 0, array);
    });
}

void ArrayProxy::append(const NdArray& rows)
{
    detail::require_writable(*file_, "ArrayProxy::append");
    guard_h5("cannot append to '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::append");

        const Shape trailing = trailing_of(leaf.shape);
        if (rows.shape() == trailing) {
            Shape one_row = trailing;
            one_row.insert(one_row.begin(), 1);
            write_rows(leaf, leaf.shape[0], rows.reshaped(std::move(one_row)));
            return;
        }
        if (rows.ndim() == leaf.shape.size() && trailing_of(rows.shape()) == trailing) {
            write_rows(leaf, leaf.shape[0], rows);
            return;
        }
        throw StorageShapeError("ArrayProxy::append: shape " + shape_to_string(rows.shape()) +
                                " does not match rows of '" + path_ + "' (" +
                                shape_to_string(trailing) + ")");
    });
}

void ArrayProxy::resize(std::size_t leading_extent)
{
    detail::require_writable(*file_, "ArrayProxy::resize");
    guard_h5("cannot resize '" + path_ + "'", [&] {
        Leaf leaf = open_leaf(*file_, path_);
        require_rows(leaf, path_, "ArrayProxy::resize");

        std::vector<hsize_t> dims = to_hsize(leaf.shape);
        dims[0] = leading_extent;
        leaf.dataset.extend(dims.data());
    });
}

// ============================================================
// Metadata
// ============================================================

Shape ArrayProxy::shape() const
{
    detail::require_open(*file_, "ArrayProxy::shape");
    return guard_h5("cannot inspect '" + path_ + "'", [&] {
        return detail::shape_of_leaf(file_->file.openDataSet(path_));
    });
}

DType ArrayProxy::dtype() const
{
    detail::require_open(*file_, "ArrayProxy::dtype");
    return guard_h5("cannot inspect '" + path_ + "'", [&] {
        return detail::dtype_of_leaf(file_->file.openDataSet(path_));
    });
}

std::size_t ArrayProxy::ndim() const
{
    return shape().size();
}

std::size_t ArrayProxy::size() const
{
    return shape_size(shape());
}

std::size_t ArrayProxy::nbytes() const
{
    return size() * dtype_size(dtype());
}

Dict ArrayProxy::attrs() const
{
    detail::require_open(*file_, "ArrayProxy::attrs");
    const Value node = guard_h5("cannot read attributes of '" + path_ + "'", [&] {
        H5::DataSet leaf = file_->file.openDataSet(path_);
        MapBuilder builder;
        const int count = leaf.getNumAttrs();
        for (int i = 0; i < count; ++i) {
            H5::Attribute attr = leaf.openAttribute(static_cast<unsigned>(i));
            const std::string name = attr.getName();
            if (name == keys::dataset) continue;
            builder.set(name, detail::read_attribute(attr));
        }
        return builder.finish();
    });

    Dict result;
    for (const auto& [name, value] : node.as_map()) {
        result.emplace(name, deserialize(value.get()));
    }
    return result;
}

bool ArrayProxy::read_only() const
{
    return file_->mode == FileMode::read_only;
}

} // namespace objgraph
