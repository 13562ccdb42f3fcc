// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file graph.cpp
/// @brief serialize / deserialize dispatch over the type registry

#include <objgraph/graph.h>
#include <objgraph/builders.h>
#include <objgraph/classifier.h>
#include <objgraph/log.h>
#include <objgraph/type_registry.h>

#include <algorithm>

namespace objgraph {

bool is_reserved_key(std::string_view key) noexcept
{
    return key == keys::class_tag || key == keys::container ||
           key == keys::dataset || key == keys::primitive;
}

namespace {

// ============================================================
// serialize
// ============================================================

Value serialize_impl(const Object& obj, bool is_copy);

Value serialize_primitive(const Object& obj)
{
    if (obj.is_null()) return Value{};
    const PrimitiveCodec* codec = TypeRegistry::instance().find_primitive(obj.type());
    if (codec->builtin) return codec->encode(obj);
    return MapBuilder()
        .set(keys::primitive, codec->name)
        .set(keys::value, codec->encode(obj))
        .finish();
}

Value serialize_dataset(const Object& obj, bool is_copy)
{
    const DatasetCodec* codec = TypeRegistry::instance().find_dataset(obj.type());
    Disassembled parts = codec->disassemble(obj);

    MapBuilder builder;
    builder.set(keys::dataset, codec->name);
    builder.set(keys::data, std::move(parts.data));
    for (const auto& [key, meta] : parts.metadata) {
        if (key == keys::data || is_reserved_key(key)) {
            throw ValidationError("dataset '" + codec->name + "' metadata key '" + key + "' is reserved");
        }
        builder.set(key, serialize_impl(meta, is_copy));
    }
    return builder.finish();
}

Value serialize_container(const Object& obj, bool is_copy)
{
    if (auto* list = obj.get_if<List>()) {
        VectorBuilder builder;
        for (const auto& item : *list) {
            builder.push_back(serialize_impl(item, is_copy));
        }
        return builder.finish();
    }

    if (auto* dict = obj.get_if<Dict>()) {
        MapBuilder builder;
        for (const auto& [key, item] : *dict) {
            if (is_reserved_key(key)) {
                throw ValidationError("dict key '" + key + "' is reserved");
            }
            builder.set(key, serialize_impl(item, is_copy));
        }
        return builder.finish();
    }

    const Set& set = obj.as<Set>();
    VectorBuilder items;
    for (const auto& item : set) {
        items.push_back(serialize_impl(item, is_copy));
    }
    return MapBuilder()
        .set(keys::container, std::string(container_kind_name(ContainerKind::set)))
        .set(keys::items, items.finish())
        .finish();
}

Value serialize_composite(Composite& instance, bool is_copy)
{
    MapBuilder builder;
    builder.set(keys::class_tag, instance.type().name());
    for (const SlotDef* slot : instance.type().all_slots()) {
        if (is_copy && !slot->is_copiable()) continue;
        builder.set(slot->name(), serialize_impl(instance.get(*slot), is_copy));
    }
    return builder.finish();
}

Value serialize_impl(const Object& obj, bool is_copy)
{
    switch (require_category(obj)) {
        case Category::primitive:
            return serialize_primitive(obj);
        case Category::dataset:
            return serialize_dataset(obj, is_copy);
        case Category::container:
            return serialize_container(obj, is_copy);
        case Category::composite:
            return serialize_composite(*obj.composite(), is_copy);
        case Category::unsupported:
            break;
    }
    throw ClassificationError(type_name(obj));
}

// ============================================================
// deserialize
// ============================================================

Object deserialize_impl(const Value& node, const DatasetHook* hook);

std::string tag_of(const Value& node, const char* key)
{
    Value tag = node.at(key);
    if (!tag.is_string()) {
        throw Error(std::string("reserved key '") + key + "' must hold a string, got " + value_to_string(tag));
    }
    return tag.as_string();
}

Object deserialize_composite(const Value& node, const DatasetHook* hook)
{
    const std::string name = tag_of(node, keys::class_tag);
    const CompositeType& type = TypeRegistry::instance().lookup_composite(name);
    auto instance = type.create();

    const auto& fields = *node.get_if<ValueMap>();
    for (const SlotDef* slot : type.all_slots()) {
        if (auto* field = fields.find(slot->name())) {
            instance->set(*slot, deserialize_impl(field->get(), hook));
        }
    }

    for (const auto& [key, field] : fields) {
        if (key != keys::class_tag && type.find_slot(key) == nullptr) {
            detail::log_name_event("deserialize", key, "is not a slot of '" + name + "', skipped");
        }
    }
    return Object{instance};
}

Object deserialize_dataset(const Value& node, const DatasetHook* hook)
{
    if (hook && *hook) {
        Object replaced = (*hook)(node);
        if (!replaced.is_null()) return replaced;
    }

    const std::string name = tag_of(node, keys::dataset);
    const DatasetCodec* codec = TypeRegistry::instance().find_dataset(name);
    if (!codec) throw ResolutionError(name);

    Value data = node.at(keys::data);
    const NdArray* array = data.as_ndarray();
    if (!array) {
        throw Error("dataset '" + name + "' node has no array under '" + keys::data + "'");
    }

    Dict metadata;
    for (const auto& [key, field] : *node.get_if<ValueMap>()) {
        if (key == keys::dataset || key == keys::data) continue;
        metadata.emplace(key, deserialize_impl(field.get(), hook));
    }
    return codec->assemble(*array, metadata);
}

Object deserialize_primitive(const Value& node)
{
    const std::string name = tag_of(node, keys::primitive);
    const PrimitiveCodec* codec = TypeRegistry::instance().find_primitive(name);
    if (!codec) throw ResolutionError(name);
    return codec->decode(node.at(keys::value));
}

Object deserialize_set(const Value& node, const DatasetHook* hook)
{
    const std::string kind = tag_of(node, keys::container);
    if (kind != container_kind_name(ContainerKind::set)) {
        throw ResolutionError(kind, "unknown container kind");
    }
    Set result;
    for (const auto& item : node.at(keys::items).as_vector()) {
        result.insert(deserialize_impl(item.get(), hook));
    }
    return Object{std::move(result)};
}

Object deserialize_impl(const Value& node, const DatasetHook* hook)
{
    return std::visit([&](const auto& arg) -> Object {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return Object{};
        } else if constexpr (std::is_same_v<T, Value::boxed_ndarray>) {
            return Object{arg.get()};
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            List result;
            result.reserve(arg.size());
            for (const auto& item : arg) {
                result.push_back(deserialize_impl(item.get(), hook));
            }
            return Object{std::move(result)};
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.count(keys::class_tag)) return deserialize_composite(node, hook);
            if (arg.count(keys::dataset)) return deserialize_dataset(node, hook);
            if (arg.count(keys::primitive)) return deserialize_primitive(node);
            if (arg.count(keys::container)) return deserialize_set(node, hook);
            Dict result;
            for (const auto& [key, item] : arg) {
                result.emplace(key, deserialize_impl(item.get(), hook));
            }
            return Object{std::move(result)};
        } else {
            return Object{arg};
        }
    }, node.data);
}

// ============================================================
// equality
// ============================================================

bool equal_dicts(const Dict& a, const Dict& b)
{
    if (a.size() != b.size()) return false;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
        if (ia->first != ib->first || !equal(ia->second, ib->second)) return false;
    }
    return true;
}

bool equal_composites(Composite& a, Composite& b)
{
    if (&a == &b) return true;
    if (&a.type() != &b.type()) return false;
    for (const SlotDef* slot : a.type().all_slots()) {
        if (!slot->is_copiable()) continue;
        if (!equal(a.get(*slot), b.get(*slot))) return false;
    }
    return true;
}

} // anonymous namespace

Value serialize(const Object& obj, bool is_copy)
{
    return serialize_impl(obj, is_copy);
}

Object deserialize(const Value& node)
{
    return deserialize_impl(node, nullptr);
}

Object deserialize(const Value& node, const DatasetHook& hook)
{
    return deserialize_impl(node, &hook);
}

bool equal(const Object& a, const Object& b)
{
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();

    const Category category = classify(a);
    if (category != classify(b)) return false;

    switch (category) {
        case Category::primitive: {
            if (a.type() != b.type()) return false;
            const PrimitiveCodec* codec = TypeRegistry::instance().find_primitive(a.type());
            return codec->encode(a) == codec->encode(b);
        }
        case Category::dataset: {
            if (a.type() != b.type()) return false;
            const DatasetCodec* codec = TypeRegistry::instance().find_dataset(a.type());
            Disassembled pa = codec->disassemble(a);
            Disassembled pb = codec->disassemble(b);
            return pa.data == pb.data && equal_dicts(pa.metadata, pb.metadata);
        }
        case Category::container: {
            if (auto* la = a.get_if<List>()) {
                auto* lb = b.get_if<List>();
                return lb && std::equal(la->begin(), la->end(), lb->begin(), lb->end(),
                                        [](const Object& x, const Object& y) { return equal(x, y); });
            }
            if (auto* da = a.get_if<Dict>()) {
                auto* db = b.get_if<Dict>();
                return db && equal_dicts(*da, *db);
            }
            auto* sb = b.get_if<Set>();
            return sb && a.as<Set>() == *sb;
        }
        case Category::composite:
            return equal_composites(*a.composite(), *b.composite());
        case Category::unsupported:
            break;
    }
    throw ClassificationError(type_name(a));
}

bool operator==(const Object& a, const Object& b)
{
    return equal(a, b);
}

Object copy(const Object& obj)
{
    return deserialize(serialize(obj, true));
}

} // namespace objgraph
