// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file composite.h
/// @brief User-defined composite types: CompositeType descriptor and Composite base.
///
/// A composite type is a C++ class deriving from Composite plus one static
/// CompositeType descriptor that lists its slots. Constructing the descriptor
/// registers the type in the TypeRegistry under its qualified name, so every
/// type defined this way is resolvable by deserialize() before first use.
///
/// Usage:
/// @code
///   class Sensor : public Composite {
///   public:
///       static const SlotDef name;
///       static const SlotDef rate;
///       static const CompositeType type;
///
///       Sensor() : Composite(type) {}
///   };
///
///   inline const SlotDef Sensor::name = SlotDef("name").with_default("");
///   inline const SlotDef Sensor::rate = SlotDef("rate").with_default(1.0);
///   inline const CompositeType Sensor::type{
///       "demo.Sensor", {&Sensor::name, &Sensor::rate}, make_factory<Sensor>()};
///
///   auto s = std::make_shared<Sensor>();
///   s->set(Sensor::rate, 2.5);
///   double r = s->get_as<double>(Sensor::rate);
/// @endcode
///
/// Instances are always owned through std::shared_ptr.

#pragma once

#include "api.h"
#include "errors.h"
#include "object.h"
#include "slot.h"

#include <tsl/robin_map.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace objgraph {

class Composite;

// ============================================================
// CompositeType
// ============================================================

class OBJGRAPH_API CompositeType {
public:
    using Factory = std::function<std::shared_ptr<Composite>()>;

    /// Define and register a composite type.
    /// @param name  Qualified name, unique across the process
    /// @param slots Slots declared by this type (base slots are inherited)
    /// @param factory Creates a default-constructed instance
    /// @param base  Parent composite type, if any
    CompositeType(std::string name,
                  std::vector<const SlotDef*> slots,
                  Factory factory,
                  const CompositeType* base = nullptr);

    CompositeType(const CompositeType&) = delete;
    CompositeType& operator=(const CompositeType&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const CompositeType* base() const noexcept { return base_; }
    [[nodiscard]] const std::vector<const SlotDef*>& own_slots() const noexcept { return slots_; }

    /// Every slot of this type, base slots first; a slot redeclared under
    /// the same name by a subtype takes the base slot's position
    [[nodiscard]] std::vector<const SlotDef*> all_slots() const;

    /// Slot by attribute name (most derived declaration wins), or nullptr
    [[nodiscard]] const SlotDef* find_slot(std::string_view name) const noexcept;

    /// True when `slot` is declared by this type or one of its bases
    [[nodiscard]] bool declares(const SlotDef& slot) const noexcept;

    /// True when this type is `other` or derives from it
    [[nodiscard]] bool is_a(const CompositeType& other) const noexcept;

    /// New default-constructed instance
    [[nodiscard]] std::shared_ptr<Composite> create() const;

private:
    std::string name_;
    std::vector<const SlotDef*> slots_;
    Factory factory_;
    const CompositeType* base_;
};

/// Factory creating a default-constructed T
template <typename T>
[[nodiscard]] CompositeType::Factory make_factory()
{
    return [] { return std::shared_ptr<Composite>(std::make_shared<T>()); };
}

// ============================================================
// Composite
// ============================================================

class OBJGRAPH_API Composite : public std::enable_shared_from_this<Composite> {
public:
    virtual ~Composite() = default;

    Composite(const Composite&) = delete;
    Composite& operator=(const Composite&) = delete;

    [[nodiscard]] const CompositeType& type() const noexcept { return *type_; }

    /// Read a slot.
    ///
    /// If nothing was ever stored, the post-initializer (if any) runs once
    /// first; if the slot is still unset it is seeded from its default
    /// without running the parser or observers.
    /// @throws SlotError when `slot` is not declared by this type
    Object get(const SlotDef& slot);
    Object get(std::string_view name);

    template <typename T>
    [[nodiscard]] T get_as(const SlotDef& slot) { return get(slot).template as<T>(); }

    template <typename T>
    [[nodiscard]] T get_as(std::string_view name) { return get(name).template as<T>(); }

    /// Write a slot: parse, enforce write-once, store, notify observers.
    /// @throws ImmutabilityError on a second assignment of a write-once slot
    /// @throws SlotError when `slot` is not declared by this type
    void set(const SlotDef& slot, Object value);
    void set(std::string_view name, Object value);

    /// set() every entry of `values` by slot name
    void assign(const Dict& values);

    /// True once a value was stored (assigned or seeded from the default)
    [[nodiscard]] bool has_value(const SlotDef& slot) const;

    /// True once the slot was assigned through set()
    [[nodiscard]] bool is_assigned(const SlotDef& slot) const;

    /// Slot by name
    /// @throws SlotError when this type declares no such slot
    [[nodiscard]] const SlotDef& slot(std::string_view name) const;

protected:
    explicit Composite(const CompositeType& type);

private:
    struct SlotState {
        Object value;
        bool has_value = false;
        bool assigned = false;
        bool post_init_done = false;
    };

    void check_declared(const SlotDef& slot) const;
    SlotState& state_for(const SlotDef& slot);
    const SlotState* find_state(const SlotDef& slot) const;

    const CompositeType* type_;
    tsl::robin_map<const SlotDef*, SlotState> state_;
};

} // namespace objgraph
