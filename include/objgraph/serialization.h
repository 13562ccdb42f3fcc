// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief Byte-level encodings of the nested Value (binary and JSON).
///
/// These are transport encodings of an already-serialized object graph,
/// independent of the HDF5 store:
/// - Binary format: compact and lossless, including paths and arrays
/// - JSON format: human-readable, used for user-primitive attribute payloads
///   and for debugging
///
/// Usage:
/// @code
///   #include <objgraph/serialization.h>
///
///   Value node = serialize(obj);          // graph.h
///   ByteBuffer buffer = to_bytes(node);
///   Value restored = from_bytes(buffer);
///
///   std::string json = to_json(node, false);  // pretty-printed
///   Value parsed = from_json(json);
/// @endcode
///
/// Binary Format Type Tags (1 byte):
///   0x00 = null (monostate)
///   0x03 = double (8 bytes, IEEE 754)
///   0x04 = bool (1 byte: 0x00=false, 0x01=true)
///   0x05 = string (4-byte length + UTF-8 data)
///   0x06 = map (4-byte count + entries)
///   0x07 = vector (4-byte count + elements)
///   0x0A = int64 (8 bytes, little-endian)
///   0x17 = path (4-byte length + generic UTF-8 path string)
///   0x18 = ndarray (1-byte dtype, 4-byte ndim, 8 bytes per extent, raw data)

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <vector>

namespace objgraph {

// ============================================================
// Binary Serialization
// ============================================================

/// Encode a Value into a self-describing byte buffer
OBJGRAPH_API ByteBuffer to_bytes(const Value& val);

/// Decode a Value from a byte buffer
/// @return Reconstructed Value; an empty buffer yields null
/// @throws objgraph::Error on truncated data or an unknown type tag
OBJGRAPH_API Value from_bytes(const ByteBuffer& buffer);

/// Decode from raw pointer and size (memory-mapped or network buffers)
OBJGRAPH_API Value from_bytes(const uint8_t* data, std::size_t size);

/// Number of bytes to_bytes() would produce
OBJGRAPH_API std::size_t serialized_size(const Value& val);

// ============================================================
// JSON Serialization
// ============================================================

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
///
/// Lossy for two alternatives:
/// - paths are written as plain strings
/// - arrays are written as nested number lists (dtype is lost)
OBJGRAPH_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// Integers without fraction or exponent parse as int64, other numbers as double.
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
OBJGRAPH_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace objgraph
