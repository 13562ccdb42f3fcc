// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ndarray.cpp
/// @brief NdArray element access and conversions

#include <objgraph/ndarray.h>

#include <sstream>

namespace objgraph {

namespace {

template <typename T>
T load(const std::byte* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return v;
}

template <typename T>
void store(std::byte* p, T v) {
    std::memcpy(p, &v, sizeof(T));
}

// Visit the element at `p` as its native C++ type
template <typename Fn>
decltype(auto) with_element(DType dtype, const std::byte* p, Fn&& fn) {
    switch (dtype) {
        case DType::int8:    return fn(load<std::int8_t>(p));
        case DType::int16:   return fn(load<std::int16_t>(p));
        case DType::int32:   return fn(load<std::int32_t>(p));
        case DType::int64:   return fn(load<std::int64_t>(p));
        case DType::uint8:   return fn(load<std::uint8_t>(p));
        case DType::uint16:  return fn(load<std::uint16_t>(p));
        case DType::uint32:  return fn(load<std::uint32_t>(p));
        case DType::uint64:  return fn(load<std::uint64_t>(p));
        case DType::float32: return fn(load<float>(p));
        case DType::float64: return fn(load<double>(p));
    }
    return fn(std::int64_t{0});
}

template <typename Src>
void store_as(DType dtype, std::byte* p, Src v) {
    switch (dtype) {
        case DType::int8:    store(p, static_cast<std::int8_t>(v)); break;
        case DType::int16:   store(p, static_cast<std::int16_t>(v)); break;
        case DType::int32:   store(p, static_cast<std::int32_t>(v)); break;
        case DType::int64:   store(p, static_cast<std::int64_t>(v)); break;
        case DType::uint8:   store(p, static_cast<std::uint8_t>(v)); break;
        case DType::uint16:  store(p, static_cast<std::uint16_t>(v)); break;
        case DType::uint32:  store(p, static_cast<std::uint32_t>(v)); break;
        case DType::uint64:  store(p, static_cast<std::uint64_t>(v)); break;
        case DType::float32: store(p, static_cast<float>(v)); break;
        case DType::float64: store(p, static_cast<double>(v)); break;
    }
}

} // anonymous namespace

std::size_t shape_size(const Shape& shape) noexcept
{
    std::size_t n = 1;
    for (auto d : shape) n *= d;
    return n;
}

std::string shape_to_string(const Shape& shape)
{
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1) oss << ",";
    oss << ")";
    return oss.str();
}

NdArray::NdArray(DType dtype, Shape shape)
    : dtype_(dtype)
    , shape_(std::move(shape))
    , bytes_(shape_size(shape_) * dtype_size(dtype), std::byte{0})
{
}

NdArray::NdArray(DType dtype, Shape shape, std::vector<std::byte> bytes)
    : dtype_(dtype)
    , shape_(std::move(shape))
    , bytes_(std::move(bytes))
{
    if (bytes_.size() != shape_size(shape_) * dtype_size(dtype_)) {
        throw StorageShapeError("NdArray: " + std::to_string(bytes_.size()) + " bytes do not match " +
                                std::string(dtype_name(dtype_)) + " shape " + shape_to_string(shape_));
    }
}

void NdArray::check_dtype(DType expected) const
{
    if (expected != dtype_) {
        throw Error("NdArray: elements are " + std::string(dtype_name(dtype_)) +
                    ", not " + std::string(dtype_name(expected)));
    }
}

double NdArray::element_as_double(std::size_t flat_index) const
{
    if (flat_index >= size()) {
        throw StorageShapeError("NdArray: index " + std::to_string(flat_index) +
                                " out of range for shape " + shape_to_string(shape_));
    }
    return with_element(dtype_, bytes_.data() + flat_index * itemsize(),
                        [](auto v) { return static_cast<double>(v); });
}

std::int64_t NdArray::element_as_int64(std::size_t flat_index) const
{
    if (flat_index >= size()) {
        throw StorageShapeError("NdArray: index " + std::to_string(flat_index) +
                                " out of range for shape " + shape_to_string(shape_));
    }
    return with_element(dtype_, bytes_.data() + flat_index * itemsize(),
                        [](auto v) { return static_cast<std::int64_t>(v); });
}

NdArray NdArray::row(std::size_t index) const
{
    if (shape_.empty()) {
        throw StorageShapeError("NdArray::row: cannot index a 0-d array");
    }
    if (index >= shape_[0]) {
        throw StorageShapeError("NdArray::row: index " + std::to_string(index) +
                                " out of range for shape " + shape_to_string(shape_));
    }
    Shape row_shape(shape_.begin() + 1, shape_.end());
    const std::size_t row_bytes = shape_size(row_shape) * itemsize();
    auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(index * row_bytes);
    return NdArray{dtype_, std::move(row_shape),
                   std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(row_bytes))};
}

NdArray NdArray::reshaped(Shape shape) const
{
    if (shape_size(shape) != size()) {
        throw StorageShapeError("NdArray::reshaped: cannot reshape " + shape_to_string(shape_) +
                                " to " + shape_to_string(shape));
    }
    return NdArray{dtype_, std::move(shape), bytes_};
}

NdArray NdArray::astype(DType dtype) const
{
    if (dtype == dtype_) return *this;
    NdArray result(dtype, shape_);
    const std::size_t n = size();
    for (std::size_t i = 0; i < n; ++i) {
        with_element(dtype_, bytes_.data() + i * itemsize(), [&](auto v) {
            store_as(dtype, result.bytes_.data() + i * result.itemsize(), v);
        });
    }
    return result;
}

} // namespace objgraph
