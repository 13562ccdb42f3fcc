// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file classifier.h
/// @brief Decide how a runtime Object is serialized.
///
/// Priority order, first match wins:
///   1. null                         -> primitive
///   2. registered primitive type    -> primitive
///   3. registered dataset type      -> dataset
///   4. List, Set or Dict            -> container
///   5. composite of a registered type -> composite
///   6. anything else                -> unsupported

#pragma once

#include "api.h"
#include "object.h"

#include <string>
#include <string_view>

namespace objgraph {

enum class Category {
    primitive,
    dataset,
    container,
    composite,
    unsupported
};

enum class ContainerKind {
    sequence,
    mapping,
    set
};

[[nodiscard]] OBJGRAPH_API Category classify(const Object& obj);

/// Category of `obj`, or ClassificationError naming its type when unsupported
OBJGRAPH_API Category require_category(const Object& obj);

/// Kind of a container Object
/// @throws ClassificationError when `obj` is not a List, Set or Dict
[[nodiscard]] OBJGRAPH_API ContainerKind container_kind(const Object& obj);

[[nodiscard]] OBJGRAPH_API std::string_view category_name(Category category) noexcept;
[[nodiscard]] OBJGRAPH_API std::string_view container_kind_name(ContainerKind kind) noexcept;

/// Qualified name of the Object's runtime type, for tags and diagnostics.
///
/// Registered primitives, datasets and composites report their registered
/// names, everything else its demangled C++ type name.
[[nodiscard]] OBJGRAPH_API std::string type_name(const Object& obj);

} // namespace objgraph
