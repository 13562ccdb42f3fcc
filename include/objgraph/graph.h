// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file graph.h
/// @brief Object graph <-> nested Value conversion, structural equality and copy.
///
/// serialize() walks an Object graph and produces a fresh Value tree:
///
/// | Object                  | Value                                                  |
/// |-------------------------|--------------------------------------------------------|
/// | null, bool, int, float, | the same scalar                                        |
/// | str, Path               |                                                        |
/// | user primitive          | {__primitive__: name, value: encoded}                  |
/// | dataset                 | {__dataset__: name, data: NdArray, <metadata>...}      |
/// | List                    | vector                                                 |
/// | Dict                    | map (keys must not be reserved)                        |
/// | Set                     | {__container__: "set", items: [...]}                   |
/// | composite               | {__class__: name, <slot>: value...}                    |
///
/// deserialize() dispatches on those reserved keys. Composite tags are
/// resolved through the TypeRegistry; an unknown tag is a ResolutionError
/// and no partial object is returned.
///
/// Object graphs must be acyclic: a cycle recurses without bound.
///
/// Usage:
/// @code
///   auto p = make<Point>({{"x", 1.0}, {"y", 2.0}});
///   Value node = serialize(p);
///   auto q = make_from<Point>(node);
///   assert(equal(p, q));
///
///   auto c = copy(p);          // copiable slots only
/// @endcode

#pragma once

#include "api.h"
#include "composite.h"
#include "errors.h"
#include "object.h"
#include "value.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace objgraph {

// ============================================================
// Reserved keys
// ============================================================

namespace keys {

inline constexpr const char* class_tag = "__class__";
inline constexpr const char* container = "__container__";
inline constexpr const char* dataset = "__dataset__";
inline constexpr const char* primitive = "__primitive__";
inline constexpr const char* data = "data";
inline constexpr const char* items = "items";
inline constexpr const char* value = "value";

} // namespace keys

/// True for the type-tag keys that may not appear as Dict keys or slot names
[[nodiscard]] OBJGRAPH_API bool is_reserved_key(std::string_view key) noexcept;

// ============================================================
// Serialization
// ============================================================

/// Convert an Object graph to a nested Value.
/// @param is_copy When true, composites contribute only their copiable slots
/// @throws ClassificationError for a value of unsupported type
/// @throws ValidationError for a Dict key or dataset metadata key that is reserved
[[nodiscard]] OBJGRAPH_API Value serialize(const Object& obj, bool is_copy = false);

/// Called for every dataset node before registry assembly; a non-null
/// result is used in place of the assembled value
using DatasetHook = std::function<Object(const Value& node)>;

/// Rebuild an Object graph from a nested Value.
///
/// Composite slots present in the node are assigned through Composite::set
/// (parsers and observers fire); absent slots keep their default. Keys that
/// name no slot of the type are skipped.
/// @throws ResolutionError for an unregistered composite, dataset or primitive tag
[[nodiscard]] OBJGRAPH_API Object deserialize(const Value& node);
[[nodiscard]] OBJGRAPH_API Object deserialize(const Value& node, const DatasetHook& hook);

// ============================================================
// Equality and copy
// ============================================================

/// Structural equality, same as operator==(const Object&, const Object&)
[[nodiscard]] OBJGRAPH_API bool equal(const Object& a, const Object& b);

/// deserialize(serialize(obj, true)): a new graph sharing nothing with `obj`
[[nodiscard]] OBJGRAPH_API Object copy(const Object& obj);

template <typename T>
    requires std::is_base_of_v<Composite, T>
[[nodiscard]] std::shared_ptr<T> copy(const std::shared_ptr<T>& instance)
{
    return copy(Object{instance}).template composite_as<T>();
}

// ============================================================
// Construction helpers
// ============================================================

/// New T with every entry of `values` assigned by slot name
template <typename T>
    requires std::is_base_of_v<Composite, T>
[[nodiscard]] std::shared_ptr<T> make(const Dict& values = {})
{
    auto instance = std::make_shared<T>();
    instance->assign(values);
    return instance;
}

/// T rebuilt from a nested Value
/// @throws ResolutionError when the node does not describe a T
template <typename T>
    requires std::is_base_of_v<Composite, T>
[[nodiscard]] std::shared_ptr<T> make_from(const Value& node)
{
    Object obj = deserialize(node);
    if (auto typed = obj.template composite_as<T>()) return typed;
    throw ResolutionError(T::type.name(), "node holds '" + node.at(keys::class_tag).as_string("<untagged>") + "'");
}

} // namespace objgraph
