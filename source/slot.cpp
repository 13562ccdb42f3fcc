// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <objgraph/slot.h>
#include <objgraph/composite.h>

#include <algorithm>

namespace objgraph {

SlotDef::SlotDef(std::string name)
    : name_(std::move(name))
{
}

SlotDef SlotDef::with_default(Object value) const
{
    SlotDef result = *this;
    result.default_ = std::move(value);
    result.factory_ = nullptr;
    return result;
}

SlotDef SlotDef::with_factory(Factory factory) const
{
    SlotDef result = *this;
    result.factory_ = std::move(factory);
    result.default_.reset();
    return result;
}

SlotDef SlotDef::with_parser(Parser parser) const
{
    SlotDef result = *this;
    result.parser_ = std::move(parser);
    return result;
}

SlotDef SlotDef::with_observer(std::string key, Observer observer) const
{
    SlotDef result = *this;
    auto it = std::find_if(result.observers_.begin(), result.observers_.end(),
                           [&](const auto& entry) { return entry.first == key; });
    if (it != result.observers_.end()) {
        it->second = std::move(observer);
    } else {
        result.observers_.emplace_back(std::move(key), std::move(observer));
    }
    return result;
}

SlotDef SlotDef::without_observer(std::string_view key) const
{
    SlotDef result = *this;
    std::erase_if(result.observers_, [&](const auto& entry) { return entry.first == key; });
    return result;
}

SlotDef SlotDef::write_once(bool enabled) const
{
    SlotDef result = *this;
    result.write_once_ = enabled;
    return result;
}

SlotDef SlotDef::copiable(bool enabled) const
{
    SlotDef result = *this;
    result.copiable_ = enabled;
    return result;
}

SlotDef SlotDef::with_post_init(PostInit hook) const
{
    SlotDef result = *this;
    result.post_init_ = std::move(hook);
    return result;
}

SlotDef SlotDef::renamed(std::string name) const
{
    SlotDef result = *this;
    result.name_ = std::move(name);
    return result;
}

std::vector<std::string> SlotDef::observer_keys() const
{
    std::vector<std::string> keys;
    keys.reserve(observers_.size());
    for (const auto& [key, observer] : observers_) {
        keys.push_back(key);
    }
    return keys;
}

Object SlotDef::make_default(Composite& owner) const
{
    if (factory_) return factory_(owner);
    if (default_) return *default_;
    return Object{};
}

Object SlotDef::parse(Composite& owner, Object raw) const
{
    if (!parser_) return raw;
    return parser_(owner, std::move(raw));
}

void SlotDef::notify(Composite& owner, const Object& previous, const Object& current) const
{
    for (const auto& [key, observer] : observers_) {
        observer(owner, previous, current);
    }
}

void SlotDef::run_post_init(Composite& owner) const
{
    if (post_init_) post_init_(owner);
}

} // namespace objgraph
