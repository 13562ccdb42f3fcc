// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ndarray.h
/// @brief Flat numeric array with a runtime element type and shape.
///
/// NdArray is the array half of a disassembled dataset value and the unit
/// of transfer for ArrayProxy reads and writes. Elements are stored
/// contiguously in row-major order.
///
/// Usage:
/// @code
///   auto a = NdArray::from<double>({1.0, 2.0, 3.0, 4.0}, {2, 2});
///   a.dtype();            // DType::float64
///   a.at<double>(3);      // 4.0
///   NdArray row = a.row(1);  // shape {2}
/// @endcode

#pragma once

#include "api.h"
#include "errors.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace objgraph {

// ============================================================
// DType
// ============================================================

enum class DType : std::uint8_t {
    int8, int16, int32, int64,
    uint8, uint16, uint32, uint64,
    float32, float64
};

[[nodiscard]] constexpr std::size_t dtype_size(DType dt) noexcept {
    switch (dt) {
        case DType::int8:    return 1;
        case DType::int16:   return 2;
        case DType::int32:   return 4;
        case DType::int64:   return 8;
        case DType::uint8:   return 1;
        case DType::uint16:  return 2;
        case DType::uint32:  return 4;
        case DType::uint64:  return 8;
        case DType::float32: return 4;
        case DType::float64: return 8;
    }
    return 0;
}

[[nodiscard]] constexpr std::string_view dtype_name(DType dt) noexcept {
    switch (dt) {
        case DType::int8:    return "int8";
        case DType::int16:   return "int16";
        case DType::int32:   return "int32";
        case DType::int64:   return "int64";
        case DType::uint8:   return "uint8";
        case DType::uint16:  return "uint16";
        case DType::uint32:  return "uint32";
        case DType::uint64:  return "uint64";
        case DType::float32: return "float32";
        case DType::float64: return "float64";
    }
    return "";
}

[[nodiscard]] constexpr std::optional<DType> parse_dtype(std::string_view s) noexcept {
    if (s == "int8")    return DType::int8;
    if (s == "int16")   return DType::int16;
    if (s == "int32")   return DType::int32;
    if (s == "int64")   return DType::int64;
    if (s == "uint8")   return DType::uint8;
    if (s == "uint16")  return DType::uint16;
    if (s == "uint32")  return DType::uint32;
    if (s == "uint64")  return DType::uint64;
    if (s == "float32") return DType::float32;
    if (s == "float64") return DType::float64;
    return std::nullopt;
}

template <typename T>
concept ArrayElement = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

/// Maps a C++ element type to its DType
template <ArrayElement T>
[[nodiscard]] constexpr DType dtype_of() noexcept {
    if constexpr (std::is_floating_point_v<T>) {
        return sizeof(T) == 4 ? DType::float32 : DType::float64;
    } else if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return DType::int8;
        else if constexpr (sizeof(T) == 2) return DType::int16;
        else if constexpr (sizeof(T) == 4) return DType::int32;
        else return DType::int64;
    } else {
        if constexpr (sizeof(T) == 1) return DType::uint8;
        else if constexpr (sizeof(T) == 2) return DType::uint16;
        else if constexpr (sizeof(T) == 4) return DType::uint32;
        else return DType::uint64;
    }
}

using Shape = std::vector<std::size_t>;

[[nodiscard]] OBJGRAPH_API std::size_t shape_size(const Shape& shape) noexcept;
[[nodiscard]] OBJGRAPH_API std::string shape_to_string(const Shape& shape);

// ============================================================
// NdArray
// ============================================================

class OBJGRAPH_API NdArray {
public:
    /// Empty one-dimensional float64 array
    NdArray() : dtype_(DType::float64), shape_{0} {}

    /// Zero-filled array of the given type and shape (empty shape = 0-d scalar)
    NdArray(DType dtype, Shape shape);

    /// Adopt raw bytes; size must equal shape_size(shape) * dtype_size(dtype)
    NdArray(DType dtype, Shape shape, std::vector<std::byte> bytes);

    template <ArrayElement T>
    static NdArray from(const std::vector<T>& values) {
        return from(values, Shape{values.size()});
    }

    template <ArrayElement T>
    static NdArray from(const std::vector<T>& values, Shape shape) {
        NdArray result(dtype_of<T>(), std::move(shape));
        if (result.size() != values.size()) {
            throw StorageShapeError("NdArray::from: " + std::to_string(values.size()) +
                                    " values do not fill shape " + shape_to_string(result.shape_));
        }
        if (!values.empty()) {
            std::memcpy(result.bytes_.data(), values.data(), values.size() * sizeof(T));
        }
        return result;
    }

    template <ArrayElement T>
    static NdArray scalar(T value) {
        NdArray result(dtype_of<T>(), Shape{});
        std::memcpy(result.bytes_.data(), &value, sizeof(T));
        return result;
    }

    [[nodiscard]] DType dtype() const noexcept { return dtype_; }
    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] std::size_t ndim() const noexcept { return shape_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return shape_size(shape_); }
    [[nodiscard]] std::size_t nbytes() const noexcept { return bytes_.size(); }
    [[nodiscard]] std::size_t itemsize() const noexcept { return dtype_size(dtype_); }

    [[nodiscard]] const std::byte* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] std::byte* data() noexcept { return bytes_.data(); }
    [[nodiscard]] const std::vector<std::byte>& bytes() const noexcept { return bytes_; }

    /// Typed view of the elements; T must match dtype() exactly
    template <ArrayElement T>
    [[nodiscard]] std::span<const T> values() const {
        check_dtype(dtype_of<T>());
        return {reinterpret_cast<const T*>(bytes_.data()), size()};
    }

    template <ArrayElement T>
    [[nodiscard]] std::span<T> values() {
        check_dtype(dtype_of<T>());
        return {reinterpret_cast<T*>(bytes_.data()), size()};
    }

    /// Element at a flat (row-major) index, converted to T
    template <ArrayElement T>
    [[nodiscard]] T at(std::size_t flat_index) const {
        if constexpr (std::is_integral_v<T>) {
            return static_cast<T>(element_as_int64(flat_index));
        } else {
            return static_cast<T>(element_as_double(flat_index));
        }
    }

    /// Element at a flat index as double (lossy for large 64-bit integers)
    [[nodiscard]] double element_as_double(std::size_t flat_index) const;

    /// Element at a flat index as int64 (floats are truncated)
    [[nodiscard]] std::int64_t element_as_int64(std::size_t flat_index) const;

    /// Sub-array at a leading-axis index (shape = shape()[1:])
    [[nodiscard]] NdArray row(std::size_t index) const;

    /// Copy with a different shape of equal element count
    [[nodiscard]] NdArray reshaped(Shape shape) const;

    /// Element-wise conversion to another dtype
    [[nodiscard]] NdArray astype(DType dtype) const;

    bool operator==(const NdArray& other) const {
        return dtype_ == other.dtype_ && shape_ == other.shape_ && bytes_ == other.bytes_;
    }

    bool operator!=(const NdArray& other) const { return !(*this == other); }

private:
    void check_dtype(DType expected) const;

    DType dtype_;
    Shape shape_;
    std::vector<std::byte> bytes_;
};

} // namespace objgraph
