// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object.h
/// @brief Object: the dynamically typed runtime value that flows through slots.
///
/// An Object is what a composite slot holds and what serialize() walks. It is
/// either null or one of:
/// - bool, int64 (every integral type is widened), double, string, path
/// - List (ordered), Set (deduplicated, order-insensitive), Dict (string keys)
/// - std::shared_ptr<Composite>
/// - NdArray
/// - any type wrapped with Object::wrap<T>() and registered as a primitive
///   or dataset in the TypeRegistry
///
/// Copying an Object copies builtin values and containers but shares
/// composite instances (they are reference types, as in the object graph).
///
/// Usage:
/// @code
///   Object n = 42;                    // int64
///   Object l = List{1, "two", 3.0};
///   Object d = Dict{{"unit", "m"}};
///   Object ts = Object::wrap(Timestamp{...});
///
///   if (auto* s = l.get_if<List>()) { ... }
///   int64_t v = n.as<int64_t>();
/// @endcode

#pragma once

#include "api.h"
#include "errors.h"
#include "ndarray.h"

#include <any>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace objgraph {

class Composite;
class Object;

using List = std::vector<Object>;
using Dict = std::map<std::string, Object>;

// ============================================================
// Set
// ============================================================

/// Unordered collection of structurally distinct Objects.
///
/// Elements keep insertion order for iteration and serialization, but two
/// sets compare equal whenever they hold equal elements in any order.
class OBJGRAPH_API Set {
public:
    using const_iterator = std::vector<Object>::const_iterator;

    Set() = default;
    Set(std::initializer_list<Object> init);

    /// Insert unless an equal element is present; returns true when inserted
    bool insert(Object item);

    /// Remove the element equal to `item`; returns true when one was removed
    bool erase(const Object& item);

    [[nodiscard]] bool contains(const Object& item) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

private:
    std::vector<Object> items_;
};

// ============================================================
// Object
// ============================================================

class OBJGRAPH_API Object {
public:
    Object() = default;
    Object(std::nullptr_t) {}
    Object(bool v) : value_(v) {}

    template <std::integral T>
        requires (!std::is_same_v<T, bool>)
    Object(T v) : value_(static_cast<std::int64_t>(v)) {}

    Object(float v) : value_(static_cast<double>(v)) {}
    Object(double v) : value_(v) {}
    Object(const char* v) : value_(std::string{v}) {}
    Object(std::string v) : value_(std::move(v)) {}
    Object(std::filesystem::path v) : value_(std::move(v)) {}
    Object(List v) : value_(std::move(v)) {}
    Object(Set v) : value_(std::move(v)) {}
    Object(Dict v) : value_(std::move(v)) {}
    Object(NdArray v) : value_(std::move(v)) {}
    Object(std::shared_ptr<Composite> v);

    /// Any composite subtype is held as std::shared_ptr<Composite>
    template <typename T>
        requires (std::is_base_of_v<Composite, T> && !std::is_same_v<T, Composite>)
    Object(std::shared_ptr<T> v) : Object(std::shared_ptr<Composite>(std::move(v))) {}

    /// Hold a value of a user type (register it as primitive or dataset first)
    template <typename T>
    [[nodiscard]] static Object wrap(T value) {
        Object result;
        result.value_ = std::move(value);
        return result;
    }

    [[nodiscard]] bool is_null() const noexcept { return !value_.has_value(); }

    /// Runtime type of the held value; null reports std::nullptr_t
    [[nodiscard]] std::type_index type() const noexcept {
        return is_null() ? std::type_index(typeid(std::nullptr_t)) : std::type_index(value_.type());
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::any_cast<T>(&value_) != nullptr; }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::any_cast<T>(&value_); }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::any_cast<T>(&value_); }

    /// Held value as T
    /// @throws objgraph::Error when the Object holds another type
    template <typename T>
    [[nodiscard]] const T& as() const {
        if (auto* p = get_if<T>()) return *p;
        throw_bad_access(typeid(T));
    }

    template <typename T>
    [[nodiscard]] T& as() {
        if (auto* p = get_if<T>()) return *p;
        throw_bad_access(typeid(T));
    }

    /// Composite instance, or nullptr when the Object holds something else
    [[nodiscard]] std::shared_ptr<Composite> composite() const;

    /// Composite instance downcast to T, or nullptr
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> composite_as() const {
        return std::dynamic_pointer_cast<T>(composite());
    }

    /// Type-erased payload (for codecs that need to forward it untouched)
    [[nodiscard]] const std::any& any() const noexcept { return value_; }

private:
    [[noreturn]] void throw_bad_access(const std::type_info& wanted) const;

    std::any value_;
};

inline std::size_t Set::size() const noexcept { return items_.size(); }
inline bool Set::empty() const noexcept { return items_.empty(); }
inline Set::const_iterator Set::begin() const noexcept { return items_.begin(); }
inline Set::const_iterator Set::end() const noexcept { return items_.end(); }

/// Structural equality (defined in graph.cpp).
///
/// Builtin values compare by value, containers element-wise (sets ignore
/// order), composites by type and by every copiable slot, datasets and user
/// primitives by their encoded form.
[[nodiscard]] OBJGRAPH_API bool operator==(const Object& a, const Object& b);

inline bool operator!=(const Object& a, const Object& b) { return !(a == b); }

[[nodiscard]] OBJGRAPH_API bool operator==(const Set& a, const Set& b);

inline bool operator!=(const Set& a, const Set& b) { return !(a == b); }

} // namespace objgraph
