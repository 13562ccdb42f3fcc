// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file slot.h
/// @brief SlotDef: a named attribute definition on a composite type.
///
/// A SlotDef describes one attribute: its default, its parser, its change
/// observers, and whether it is write-once, copiable, or lazily
/// post-initialized. The definition is shared by every instance of the
/// owning type and its subtypes; the per-instance value lives in the
/// Composite (see composite.h).
///
/// Every configuration method returns a new SlotDef and leaves the original
/// untouched, so a definition can serve as a template for others:
///
/// @code
///   const SlotDef positive = SlotDef("value")
///       .with_default(0)
///       .with_parser([](Composite&, Object raw) {
///           if (raw.as<int64_t>() < 0) throw ValidationError("value must be >= 0");
///           return raw;
///       });
///
///   const SlotDef count = positive.renamed("count").with_default(1);
/// @endcode

#pragma once

#include "api.h"
#include "object.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objgraph {

class Composite;

class OBJGRAPH_API SlotDef {
public:
    /// Per-instance default; called once per instance, on first read
    using Factory = std::function<Object(Composite&)>;
    /// Validate or convert a raw assignment; throw to reject it
    using Parser = std::function<Object(Composite&, Object)>;
    /// Called after a store with (instance, previous, new)
    using Observer = std::function<void(Composite&, const Object&, const Object&)>;
    /// Deferred initialization, run once before the first read of an unset slot
    using PostInit = std::function<void(Composite&)>;

    explicit SlotDef(std::string name);

    // ============================================================
    // Builders (non-mutating)
    // ============================================================

    /// Static default shared by value (replaces any factory)
    [[nodiscard]] SlotDef with_default(Object value) const;

    /// Per-instance default (replaces any static default)
    [[nodiscard]] SlotDef with_factory(Factory factory) const;

    [[nodiscard]] SlotDef with_parser(Parser parser) const;

    /// Add an observer under `key`; an existing observer with the same key is
    /// replaced in place and keeps its position
    [[nodiscard]] SlotDef with_observer(std::string key, Observer observer) const;

    /// Remove the observer registered under `key` (no-op when absent)
    [[nodiscard]] SlotDef without_observer(std::string_view key) const;

    [[nodiscard]] SlotDef write_once(bool enabled = true) const;
    [[nodiscard]] SlotDef copiable(bool enabled) const;
    [[nodiscard]] SlotDef with_post_init(PostInit hook) const;

    /// Same definition under another attribute name
    [[nodiscard]] SlotDef renamed(std::string name) const;

    // ============================================================
    // Introspection
    // ============================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] bool has_default() const noexcept { return default_.has_value() || static_cast<bool>(factory_); }
    [[nodiscard]] bool has_factory() const noexcept { return static_cast<bool>(factory_); }
    [[nodiscard]] bool has_parser() const noexcept { return static_cast<bool>(parser_); }
    [[nodiscard]] bool has_post_init() const noexcept { return static_cast<bool>(post_init_); }
    [[nodiscard]] bool is_write_once() const noexcept { return write_once_; }
    [[nodiscard]] bool is_copiable() const noexcept { return copiable_; }
    [[nodiscard]] std::vector<std::string> observer_keys() const;

    // ============================================================
    // Hooks invoked by Composite
    // ============================================================

    /// Default for `owner`: factory result, static default, or null
    [[nodiscard]] Object make_default(Composite& owner) const;

    /// Parser result, or `raw` unchanged when no parser is set
    [[nodiscard]] Object parse(Composite& owner, Object raw) const;

    /// Call every observer in registration order; exceptions propagate
    void notify(Composite& owner, const Object& previous, const Object& current) const;

    void run_post_init(Composite& owner) const;

private:
    std::string name_;
    std::optional<Object> default_;
    Factory factory_;
    Parser parser_;
    std::vector<std::pair<std::string, Observer>> observers_;
    PostInit post_init_;
    bool write_once_ = false;
    bool copiable_ = true;
};

} // namespace objgraph
