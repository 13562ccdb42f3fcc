// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_registry.h
/// @brief Process-wide registry of composite, primitive and dataset types.
///
/// The serializer hard-codes no type list: every runtime type it can handle
/// is found here.
///
/// - Composite types register themselves by qualified name when their static
///   CompositeType descriptor is constructed (see composite.h).
/// - Primitive types are stored verbatim. Built-ins: NoneType, bool, int,
///   float, str, Path. Users add their own with an encode/decode pair.
/// - Dataset types convert to an NdArray plus a metadata Dict and back.
///
/// A type cannot be both primitive and dataset: the second registration
/// throws RegistrationError.
///
/// Thread safety: none. All registration must finish before concurrent reads.
///
/// Usage:
/// @code
///   auto& reg = TypeRegistry::instance();
///
///   reg.register_primitive<Color>("demo.Color",
///       [](const Color& c) { return Value{c.rgb}; },
///       [](const Value& v) { return Color{v.as_int()}; });
///
///   reg.register_dataset<Track>("demo.Track",
///       [](const Track& t) { return Disassembled{t.samples, Dict{{"unit", "m"}}}; },
///       [](NdArray data, const Dict& meta) { return Track{std::move(data), meta.at("unit").as<std::string>()}; });
/// @endcode

#pragma once

#include "api.h"
#include "errors.h"
#include "object.h"
#include "value.h"

#include <tsl/robin_map.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace objgraph {

class CompositeType;

// ============================================================
// Codecs
// ============================================================

/// Conversion of a primitive type to and from a scalar Value
struct PrimitiveCodec {
    std::string name;
    std::function<Value(const Object&)> encode;
    std::function<Object(const Value&)> decode;
    /// Built-in primitives serialize as bare scalars, user ones as tagged maps
    bool builtin = false;
};

/// A dataset value split into its array and its metadata
struct Disassembled {
    NdArray data;
    Dict metadata;
};

/// Conversion of a dataset type to and from an array plus metadata
struct DatasetCodec {
    std::string name;
    std::function<Disassembled(const Object&)> disassemble;
    std::function<Object(NdArray, const Dict&)> assemble;
};

namespace detail {

/// Transparent string hash for heterogeneous robin_map lookup
struct RegistryStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

struct RegistryStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

template <typename T>
using NameMap = tsl::robin_map<std::string, T, RegistryStringHash, RegistryStringEqual>;

} // namespace detail

// ============================================================
// TypeRegistry
// ============================================================

class OBJGRAPH_API TypeRegistry {
public:
    /// The process-wide registry (built-in primitives and datasets installed)
    static TypeRegistry& instance();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    // --------------------------------------------------------
    // Composite types
    // --------------------------------------------------------

    /// Register `type` under `name`; a different type already registered
    /// under the same name is replaced (last definition wins)
    void register_composite(const std::string& name, const CompositeType& type);

    /// @throws ResolutionError when `name` is not registered
    [[nodiscard]] const CompositeType& lookup_composite(std::string_view name) const;

    /// nullptr when `name` is not registered
    [[nodiscard]] const CompositeType* find_composite(std::string_view name) const noexcept;

    [[nodiscard]] bool is_registered(std::string_view name) const noexcept;

    /// True when `type` is the descriptor currently registered under its name
    [[nodiscard]] bool is_registered(const CompositeType& type) const noexcept;

    [[nodiscard]] std::vector<std::string> composite_names() const;

    // --------------------------------------------------------
    // Primitive types
    // --------------------------------------------------------

    /// Register a primitive type; registering it again replaces the codec
    /// @throws RegistrationError when `type` is already a dataset type
    void register_primitive(std::type_index type, PrimitiveCodec codec);

    template <typename T, typename Encode, typename Decode>
    void register_primitive(std::string name, Encode encode, Decode decode) {
        PrimitiveCodec codec;
        codec.name = std::move(name);
        codec.encode = [encode = std::move(encode)](const Object& obj) -> Value {
            return encode(obj.as<T>());
        };
        codec.decode = [decode = std::move(decode)](const Value& val) -> Object {
            return Object::wrap<T>(decode(val));
        };
        register_primitive(std::type_index(typeid(T)), std::move(codec));
    }

    /// Remove a primitive type; returns false (and does nothing) when absent
    bool remove_primitive(std::type_index type);

    template <typename T>
    bool remove_primitive() { return remove_primitive(std::type_index(typeid(T))); }

    [[nodiscard]] bool is_primitive(std::type_index type) const noexcept;

    template <typename T>
    [[nodiscard]] bool is_primitive() const noexcept { return is_primitive(std::type_index(typeid(T))); }

    [[nodiscard]] const PrimitiveCodec* find_primitive(std::type_index type) const noexcept;
    [[nodiscard]] const PrimitiveCodec* find_primitive(std::string_view name) const noexcept;

    // --------------------------------------------------------
    // Dataset types
    // --------------------------------------------------------

    /// Register a dataset type; registering it again replaces the codec
    /// @throws RegistrationError when `type` is already a primitive type
    void register_dataset(std::type_index type, DatasetCodec codec);

    template <typename T, typename Disassemble, typename Assemble>
    void register_dataset(std::string name, Disassemble disassemble, Assemble assemble) {
        DatasetCodec codec;
        codec.name = std::move(name);
        codec.disassemble = [disassemble = std::move(disassemble)](const Object& obj) -> Disassembled {
            return disassemble(obj.as<T>());
        };
        codec.assemble = [assemble = std::move(assemble)](NdArray data, const Dict& metadata) -> Object {
            return Object::wrap<T>(assemble(std::move(data), metadata));
        };
        register_dataset(std::type_index(typeid(T)), std::move(codec));
    }

    bool remove_dataset(std::type_index type);

    template <typename T>
    bool remove_dataset() { return remove_dataset(std::type_index(typeid(T))); }

    [[nodiscard]] bool is_dataset(std::type_index type) const noexcept;

    template <typename T>
    [[nodiscard]] bool is_dataset() const noexcept { return is_dataset(std::type_index(typeid(T))); }

    [[nodiscard]] const DatasetCodec* find_dataset(std::type_index type) const noexcept;
    [[nodiscard]] const DatasetCodec* find_dataset(std::string_view name) const noexcept;

private:
    TypeRegistry();

    void install_builtin_primitives();

    detail::NameMap<const CompositeType*> composites_;

    tsl::robin_map<std::type_index, std::shared_ptr<const PrimitiveCodec>> primitives_;
    detail::NameMap<std::shared_ptr<const PrimitiveCodec>> primitives_by_name_;

    tsl::robin_map<std::type_index, std::shared_ptr<const DatasetCodec>> datasets_;
    detail::NameMap<std::shared_ptr<const DatasetCodec>> datasets_by_name_;
};

} // namespace objgraph
