// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.cpp
/// @brief TypeRegistry implementation and built-in primitive codecs

#include <objgraph/type_registry.h>
#include <objgraph/composite.h>
#include <objgraph/datasets.h>
#include <objgraph/log.h>

#include <algorithm>

namespace objgraph {

TypeRegistry& TypeRegistry::instance()
{
    static TypeRegistry registry;
    return registry;
}

TypeRegistry::TypeRegistry()
{
    install_builtin_primitives();
    detail::install_builtin_datasets(*this);
}

// ============================================================
// Composite types
// ============================================================

void TypeRegistry::register_composite(const std::string& name, const CompositeType& type)
{
    auto it = composites_.find(name);
    if (it != composites_.end()) {
        if (it->second != &type) {
            detail::log_name_event("TypeRegistry::register_composite", name,
                                   "re-registered, previous definition replaced");
        }
        it.value() = &type;
        return;
    }
    composites_.emplace(name, &type);
}

const CompositeType& TypeRegistry::lookup_composite(std::string_view name) const
{
    if (auto* type = find_composite(name)) return *type;
    throw ResolutionError(std::string(name));
}

const CompositeType* TypeRegistry::find_composite(std::string_view name) const noexcept
{
    auto it = composites_.find(name);
    return it != composites_.end() ? it->second : nullptr;
}

bool TypeRegistry::is_registered(std::string_view name) const noexcept
{
    return composites_.find(name) != composites_.end();
}

bool TypeRegistry::is_registered(const CompositeType& type) const noexcept
{
    return find_composite(type.name()) == &type;
}

std::vector<std::string> TypeRegistry::composite_names() const
{
    std::vector<std::string> names;
    names.reserve(composites_.size());
    for (const auto& [name, type] : composites_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ============================================================
// Primitive types
// ============================================================

void TypeRegistry::register_primitive(std::type_index type, PrimitiveCodec codec)
{
    if (datasets_.count(type) > 0) {
        throw RegistrationError("cannot register '" + codec.name +
                                "' as primitive: type is already registered as dataset '" +
                                datasets_.at(type)->name + "'");
    }
    if (auto it = primitives_.find(type); it != primitives_.end()) {
        primitives_by_name_.erase(it->second->name);
    }
    auto shared = std::make_shared<const PrimitiveCodec>(std::move(codec));
    primitives_by_name_[shared->name] = shared;
    primitives_[type] = std::move(shared);
}

bool TypeRegistry::remove_primitive(std::type_index type)
{
    auto it = primitives_.find(type);
    if (it == primitives_.end()) return false;
    primitives_by_name_.erase(it->second->name);
    primitives_.erase(it);
    return true;
}

bool TypeRegistry::is_primitive(std::type_index type) const noexcept
{
    return primitives_.find(type) != primitives_.end();
}

const PrimitiveCodec* TypeRegistry::find_primitive(std::type_index type) const noexcept
{
    auto it = primitives_.find(type);
    return it != primitives_.end() ? it->second.get() : nullptr;
}

const PrimitiveCodec* TypeRegistry::find_primitive(std::string_view name) const noexcept
{
    auto it = primitives_by_name_.find(name);
    return it != primitives_by_name_.end() ? it->second.get() : nullptr;
}

// ============================================================
// Dataset types
// ============================================================

void TypeRegistry::register_dataset(std::type_index type, DatasetCodec codec)
{
    if (primitives_.count(type) > 0) {
        throw RegistrationError("cannot register '" + codec.name +
                                "' as dataset: type is already registered as primitive '" +
                                primitives_.at(type)->name + "'");
    }
    if (auto it = datasets_.find(type); it != datasets_.end()) {
        datasets_by_name_.erase(it->second->name);
    }
    auto shared = std::make_shared<const DatasetCodec>(std::move(codec));
    datasets_by_name_[shared->name] = shared;
    datasets_[type] = std::move(shared);
}

bool TypeRegistry::remove_dataset(std::type_index type)
{
    auto it = datasets_.find(type);
    if (it == datasets_.end()) return false;
    datasets_by_name_.erase(it->second->name);
    datasets_.erase(it);
    return true;
}

bool TypeRegistry::is_dataset(std::type_index type) const noexcept
{
    return datasets_.find(type) != datasets_.end();
}

const DatasetCodec* TypeRegistry::find_dataset(std::type_index type) const noexcept
{
    auto it = datasets_.find(type);
    return it != datasets_.end() ? it->second.get() : nullptr;
}

const DatasetCodec* TypeRegistry::find_dataset(std::string_view name) const noexcept
{
    auto it = datasets_by_name_.find(name);
    return it != datasets_by_name_.end() ? it->second.get() : nullptr;
}

// ============================================================
// Built-in primitives
// ============================================================

namespace {

template <typename T>
PrimitiveCodec builtin_codec(std::string name)
{
    PrimitiveCodec codec;
    codec.name = std::move(name);
    codec.builtin = true;
    codec.encode = [](const Object& obj) { return Value{obj.as<T>()}; };
    codec.decode = [label = codec.name](const Value& val) -> Object {
        if (auto* p = val.get_if<T>()) return Object{*p};
        throw Error("cannot decode " + value_to_string(val) + " as primitive '" + label + "'");
    };
    return codec;
}

} // anonymous namespace

void TypeRegistry::install_builtin_primitives()
{
    PrimitiveCodec none;
    none.name = "NoneType";
    none.builtin = true;
    none.encode = [](const Object&) { return Value{}; };
    none.decode = [](const Value&) { return Object{}; };
    register_primitive(std::type_index(typeid(std::nullptr_t)), std::move(none));

    register_primitive(std::type_index(typeid(bool)), builtin_codec<bool>("bool"));
    register_primitive(std::type_index(typeid(std::int64_t)), builtin_codec<std::int64_t>("int"));
    register_primitive(std::type_index(typeid(double)), builtin_codec<double>("float"));
    register_primitive(std::type_index(typeid(std::string)), builtin_codec<std::string>("str"));
    register_primitive(std::type_index(typeid(std::filesystem::path)),
                       builtin_codec<std::filesystem::path>("Path"));
}

} // namespace objgraph
