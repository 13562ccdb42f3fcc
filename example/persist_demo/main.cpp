// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file main.cpp
/// @brief Demonstrates defining composite types and persisting them to HDF5
///
/// This example shows:
/// - Composite types with defaults, parsers, observers and write-once slots
/// - A user primitive (Rgb) and a user dataset (Trace)
/// - serialize / deserialize / copy on an object graph
/// - save / load of the whole graph
/// - Lazy load and in-place growth of an array through ArrayProxy
/// - Session attributes

#include <objgraph/datasets.h>
#include <objgraph/graph.h>
#include <objgraph/serialization.h>
#include <objgraph/store.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace objgraph;

// ============================================================================
// User types
// ============================================================================

struct Rgb {
    int64_t packed = 0;
};

struct Trace {
    NdArray samples;
    double rate_hz = 1.0;
};

class Channel : public Composite {
public:
    static const SlotDef name;
    static const SlotDef color;
    static const SlotDef trace;
    static const CompositeType type;

    Channel() : Composite(type) {}
};

inline const SlotDef Channel::name = SlotDef("name").with_default("");
inline const SlotDef Channel::color = SlotDef("color");
inline const SlotDef Channel::trace = SlotDef("trace");
inline const CompositeType Channel::type{
    "demo.Channel", {&Channel::name, &Channel::color, &Channel::trace}, make_factory<Channel>()};

class Recording : public Composite {
public:
    static const SlotDef id;
    static const SlotDef operator_name;
    static const SlotDef revision;
    static const SlotDef started;
    static const SlotDef channels;
    static const SlotDef samples;
    static const CompositeType type;

    Recording() : Composite(type) {}
};

inline const SlotDef Recording::id = SlotDef("id").write_once();

inline const SlotDef Recording::operator_name = SlotDef("operator")
    .with_default("unknown")
    .with_parser([](Composite&, Object raw) -> Object {
        if (!raw.is<std::string>() || raw.as<std::string>().empty()) {
            throw ValidationError("operator must be a non-empty string");
        }
        return raw;
    })
    .with_observer("revision", [](Composite& self, const Object&, const Object&) {
        self.set(Recording::revision, self.get_as<int64_t>(Recording::revision) + 1);
    });

inline const SlotDef Recording::revision = SlotDef("revision").with_default(0);
inline const SlotDef Recording::started = SlotDef("started");
inline const SlotDef Recording::channels = SlotDef("channels").with_factory([](Composite&) -> Object { return List{}; });
inline const SlotDef Recording::samples = SlotDef("samples");

inline const CompositeType Recording::type{
    "demo.Recording",
    {&Recording::id, &Recording::operator_name, &Recording::revision,
     &Recording::started, &Recording::channels, &Recording::samples},
    make_factory<Recording>()};

void register_demo_types()
{
    auto& reg = TypeRegistry::instance();
    reg.register_primitive<Rgb>(
        "demo.Rgb",
        [](const Rgb& c) { return Value{c.packed}; },
        [](const Value& v) { return Rgb{v.as_int()}; });
    reg.register_dataset<Trace>(
        "demo.Trace",
        [](const Trace& t) { return Disassembled{t.samples, Dict{{"rate_hz", t.rate_hz}}}; },
        [](NdArray data, const Dict& meta) { return Trace{std::move(data), meta.at("rate_hz").as<double>()}; });
}

// ============================================================================
// Demo sections
// ============================================================================

std::shared_ptr<Recording> build_recording()
{
    auto left = make<Channel>({
        {"name", "left"},
        {"color", Object::wrap(Rgb{0xff0000})},
        {"trace", Object::wrap(Trace{NdArray::from<float>({0.1f, 0.2f, 0.3f}), 48000.0})},
    });
    auto right = make<Channel>({
        {"name", "right"},
        {"color", Object::wrap(Rgb{0x0000ff})},
        {"trace", Object::wrap(Trace{NdArray::from<float>({-0.1f, -0.2f, -0.3f}), 48000.0})},
    });

    auto rec = make<Recording>({
        {"id", "rec-001"},
        {"started", Object::wrap(make_timestamp("2024-06-01 09:30:00"))},
        {"channels", List{left, right}},
        {"samples", NdArray::from<double>({1.0, 2.0, 3.0})},
    });
    rec->set(Recording::operator_name, "ada");
    return rec;
}

void demo_slots(const std::shared_ptr<Recording>& rec)
{
    std::cout << "\n=== Slots ===\n";
    std::cout << "operator: " << rec->get_as<std::string>(Recording::operator_name)
              << " (revision " << rec->get_as<int64_t>(Recording::revision) << ")\n";

    try {
        rec->set(Recording::id, "rec-002");
    } catch (const ImmutabilityError& e) {
        std::cout << "write-once: " << e.what() << "\n";
    }

    try {
        rec->set(Recording::operator_name, "");
    } catch (const ValidationError& e) {
        std::cout << "parser: " << e.what() << "\n";
    }
}

void demo_graph(const std::shared_ptr<Recording>& rec)
{
    std::cout << "\n=== Nested form ===\n";
    Value node = serialize(Object{rec});
    std::cout << to_json(node, false) << "\n";

    auto restored = make_from<Recording>(node);
    std::cout << "round trip equal: " << std::boolalpha << equal(Object{restored}, Object{rec}) << "\n";

    auto duplicate = copy(rec);
    std::cout << "copy shares instance: " << (duplicate.get() == rec.get()) << "\n";
}

void demo_store(const std::shared_ptr<Recording>& rec, const std::filesystem::path& file)
{
    std::cout << "\n=== Store ===\n";
    save(Object{rec}, file);
    std::cout << "saved to " << file.string() << "\n";

    {
        Session s(file, FileMode::read_write);
        auto lazy = s.load(Materialize::lazy).composite_as<Recording>();
        Object samples = lazy->get(Recording::samples);
        if (auto* proxy = samples.get_if<ArrayProxy>()) {
            std::cout << "lazy samples " << proxy->path() << " shape " << shape_to_string(proxy->shape()) << "\n";
            proxy->append(NdArray::from<double>({4.0, 5.0}));
            std::cout << "after append: " << shape_to_string(proxy->shape()) << "\n";
        }
        s.set_attribute("/", "status", "reviewed");
        std::cout << "pending attributes: " << s.pending() << "\n";
    }

    auto loaded = load(file).composite_as<Recording>();
    NdArray samples = loaded->get_as<NdArray>(Recording::samples);
    std::cout << "reloaded samples:";
    for (double v : samples.values<double>()) {
        std::cout << " " << v;
    }
    std::cout << "\n";

    Session reader(file);
    std::cout << "status attribute: " << reader.attribute("/", "status").as<std::string>() << "\n";
}

int main()
{
    register_demo_types();

    const std::filesystem::path file = std::filesystem::temp_directory_path() / "objgraph_persist_demo.h5";

    try {
        auto rec = build_recording();
        demo_slots(rec);
        demo_graph(rec);
        demo_store(rec, file);
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::remove(file, ec);
    return 0;
}
