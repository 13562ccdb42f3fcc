// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object.cpp
/// @brief Object accessors and Set membership

#include <objgraph/object.h>
#include <objgraph/classifier.h>
#include <objgraph/composite.h>

#include <boost/core/demangle.hpp>

#include <algorithm>

namespace objgraph {

// ============================================================
// Set
// ============================================================

Set::Set(std::initializer_list<Object> init)
{
    for (const auto& item : init) {
        insert(item);
    }
}

bool Set::insert(Object item)
{
    if (contains(item)) return false;
    items_.push_back(std::move(item));
    return true;
}

bool Set::erase(const Object& item)
{
    auto it = std::find(items_.begin(), items_.end(), item);
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
}

bool Set::contains(const Object& item) const
{
    return std::find(items_.begin(), items_.end(), item) != items_.end();
}

bool operator==(const Set& a, const Set& b)
{
    if (a.size() != b.size()) return false;
    // Elements are distinct within each set, so inclusion one way suffices
    return std::all_of(a.begin(), a.end(), [&](const Object& item) { return b.contains(item); });
}

// ============================================================
// Object
// ============================================================

Object::Object(std::shared_ptr<Composite> v)
{
    if (v) value_ = std::move(v);
}

std::shared_ptr<Composite> Object::composite() const
{
    if (auto* p = get_if<std::shared_ptr<Composite>>()) return *p;
    return nullptr;
}

void Object::throw_bad_access(const std::type_info& wanted) const
{
    throw Error("Object holds '" + type_name(*this) + "', not '" +
                boost::core::demangle(wanted.name()) + "'");
}

} // namespace objgraph
