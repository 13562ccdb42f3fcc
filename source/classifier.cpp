// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/classifier.h>
#include <objgraph/composite.h>
#include <objgraph/type_registry.h>

#include <boost/core/demangle.hpp>

namespace objgraph {

Category classify(const Object& obj)
{
    if (obj.is_null()) return Category::primitive;

    const auto& reg = TypeRegistry::instance();
    const auto type = obj.type();
    if (reg.is_primitive(type)) return Category::primitive;
    if (reg.is_dataset(type)) return Category::dataset;
    if (obj.is<List>() || obj.is<Set>() || obj.is<Dict>()) return Category::container;
    if (auto composite = obj.composite()) {
        if (reg.is_registered(composite->type())) return Category::composite;
    }
    return Category::unsupported;
}

Category require_category(const Object& obj)
{
    const Category category = classify(obj);
    if (category == Category::unsupported) {
        throw ClassificationError(type_name(obj));
    }
    return category;
}

ContainerKind container_kind(const Object& obj)
{
    if (obj.is<List>()) return ContainerKind::sequence;
    if (obj.is<Dict>()) return ContainerKind::mapping;
    if (obj.is<Set>()) return ContainerKind::set;
    throw ClassificationError(type_name(obj));
}

std::string_view category_name(Category category) noexcept
{
    switch (category) {
        case Category::primitive:   return "primitive";
        case Category::dataset:     return "dataset";
        case Category::container:   return "container";
        case Category::composite:   return "composite";
        case Category::unsupported: return "unsupported";
    }
    return "";
}

std::string_view container_kind_name(ContainerKind kind) noexcept
{
    switch (kind) {
        case ContainerKind::sequence: return "sequence";
        case ContainerKind::mapping:  return "mapping";
        case ContainerKind::set:      return "set";
    }
    return "";
}

std::string type_name(const Object& obj)
{
    const auto& reg = TypeRegistry::instance();
    const auto type = obj.type();
    if (auto* codec = reg.find_primitive(type)) return codec->name;
    if (auto* codec = reg.find_dataset(type)) return codec->name;
    if (obj.is<List>()) return "list";
    if (obj.is<Set>()) return "set";
    if (obj.is<Dict>()) return "dict";
    if (auto composite = obj.composite()) return composite->type().name();
    return boost::core::demangle(type.name());
}

} // namespace objgraph
