// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file composite.cpp
/// @brief CompositeType registration and Composite slot access

#include <objgraph/composite.h>
#include <objgraph/graph.h>
#include <objgraph/type_registry.h>

#include <algorithm>

namespace objgraph {

// ============================================================
// CompositeType
// ============================================================

CompositeType::CompositeType(std::string name,
                             std::vector<const SlotDef*> slots,
                             Factory factory,
                             const CompositeType* base)
    : name_(std::move(name))
    , slots_(std::move(slots))
    , factory_(std::move(factory))
    , base_(base)
{
    for (const SlotDef* slot : slots_) {
        if (is_reserved_key(slot->name())) {
            throw RegistrationError("composite type '" + name_ + "' declares reserved slot name '" +
                                    slot->name() + "'");
        }
    }
    TypeRegistry::instance().register_composite(name_, *this);
}

std::vector<const SlotDef*> CompositeType::all_slots() const
{
    std::vector<const SlotDef*> result = base_ ? base_->all_slots() : std::vector<const SlotDef*>{};
    for (const SlotDef* slot : slots_) {
        auto same_name = std::find_if(result.begin(), result.end(),
                                      [&](const SlotDef* s) { return s->name() == slot->name(); });
        if (same_name != result.end()) {
            *same_name = slot;
        } else {
            result.push_back(slot);
        }
    }
    return result;
}

const SlotDef* CompositeType::find_slot(std::string_view name) const noexcept
{
    for (const CompositeType* t = this; t != nullptr; t = t->base_) {
        for (const SlotDef* slot : t->slots_) {
            if (slot->name() == name) return slot;
        }
    }
    return nullptr;
}

bool CompositeType::declares(const SlotDef& slot) const noexcept
{
    for (const CompositeType* t = this; t != nullptr; t = t->base_) {
        if (std::find(t->slots_.begin(), t->slots_.end(), &slot) != t->slots_.end()) return true;
    }
    return false;
}

bool CompositeType::is_a(const CompositeType& other) const noexcept
{
    for (const CompositeType* t = this; t != nullptr; t = t->base_) {
        if (t == &other) return true;
    }
    return false;
}

std::shared_ptr<Composite> CompositeType::create() const
{
    if (!factory_) {
        throw Error("composite type '" + name_ + "' has no factory");
    }
    auto instance = factory_();
    if (!instance || &instance->type() != this) {
        throw Error("factory of composite type '" + name_ + "' produced an instance of another type");
    }
    return instance;
}

// ============================================================
// Composite
// ============================================================

Composite::Composite(const CompositeType& type)
    : type_(&type)
{
}

void Composite::check_declared(const SlotDef& slot) const
{
    if (!type_->declares(slot)) {
        throw SlotError("slot '" + slot.name() + "' is not declared by '" + type_->name() + "'");
    }
}

Composite::SlotState& Composite::state_for(const SlotDef& slot)
{
    return state_[&slot];
}

const Composite::SlotState* Composite::find_state(const SlotDef& slot) const
{
    auto it = state_.find(&slot);
    return it != state_.end() ? &it->second : nullptr;
}

// Callbacks may touch other slots and rehash state_, so no SlotState
// reference is held across a call into user code.
Object Composite::get(const SlotDef& slot)
{
    check_declared(slot);

    {
        SlotState& st = state_for(slot);
        if (!st.has_value && !st.post_init_done && slot.has_post_init()) {
            st.post_init_done = true;
            slot.run_post_init(*this);
        }
    }

    if (!state_for(slot).has_value && slot.has_default()) {
        Object seeded = slot.make_default(*this);
        SlotState& st = state_for(slot);
        if (!st.has_value) {
            st.value = std::move(seeded);
            st.has_value = true;
        }
    }

    return state_for(slot).value;
}

Object Composite::get(std::string_view name)
{
    return get(this->slot(name));
}

void Composite::set(const SlotDef& slot, Object value)
{
    check_declared(slot);

    Object parsed = slot.parse(*this, std::move(value));

    Object previous;
    {
        SlotState& st = state_for(slot);
        if (slot.is_write_once() && st.assigned) {
            throw ImmutabilityError(type_->name(), slot.name());
        }
        previous = std::move(st.value);
        st.value = parsed;
        st.has_value = true;
        st.assigned = true;
    }

    slot.notify(*this, previous, parsed);
}

void Composite::set(std::string_view name, Object value)
{
    set(this->slot(name), std::move(value));
}

void Composite::assign(const Dict& values)
{
    for (const auto& [name, value] : values) {
        set(name, value);
    }
}

bool Composite::has_value(const SlotDef& slot) const
{
    check_declared(slot);
    auto* st = find_state(slot);
    return st != nullptr && st->has_value;
}

bool Composite::is_assigned(const SlotDef& slot) const
{
    check_declared(slot);
    auto* st = find_state(slot);
    return st != nullptr && st->assigned;
}

const SlotDef& Composite::slot(std::string_view name) const
{
    if (auto* found = type_->find_slot(name)) return *found;
    throw SlotError("'" + type_->name() + "' has no slot '" + std::string(name) + "'");
}

} // namespace objgraph
