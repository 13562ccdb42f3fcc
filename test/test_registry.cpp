// test_registry.cpp - Tests for TypeRegistry and the value classifier
// Module 3: Type resolution

#include <catch2/catch_all.hpp>
#include <objgraph/classifier.h>
#include <objgraph/datasets.h>
#include <objgraph/type_registry.h>

#include "test_types.h"

#include <algorithm>

using namespace objgraph;
using namespace objgraph::test;

namespace {

struct Opaque {
    int x = 0;
};

struct Both {
    int64_t v = 0;
};

} // namespace

// ============================================================
// Composite registration
// ============================================================

TEST_CASE("Composite types register when defined", "[registry][composite]") {
    auto& reg = TypeRegistry::instance();

    REQUIRE(reg.is_registered("tests.Point"));
    REQUIRE(reg.is_registered(Point::type));
    REQUIRE(&reg.lookup_composite("tests.Point") == &Point::type);
    REQUIRE(reg.find_composite("tests.LabeledPoint") == &LabeledPoint::type);

    auto names = reg.composite_names();
    REQUIRE(std::find(names.begin(), names.end(), "tests.Sample") != names.end());
}

TEST_CASE("Unknown composite names", "[registry][composite]") {
    auto& reg = TypeRegistry::instance();

    REQUIRE_FALSE(reg.is_registered("tests.DoesNotExist"));
    REQUIRE(reg.find_composite("tests.DoesNotExist") == nullptr);
    REQUIRE_THROWS_AS(reg.lookup_composite("tests.DoesNotExist"), ResolutionError);

    try {
        (void)reg.lookup_composite("tests.DoesNotExist");
    } catch (const ResolutionError& e) {
        REQUIRE(e.name() == "tests.DoesNotExist");
    }
}

TEST_CASE("Registering a composite twice is idempotent", "[registry][composite]") {
    auto& reg = TypeRegistry::instance();
    const auto before = reg.composite_names().size();

    reg.register_composite(Point::type.name(), Point::type);

    REQUIRE(reg.composite_names().size() == before);
    REQUIRE(&reg.lookup_composite("tests.Point") == &Point::type);
}

TEST_CASE("Reserved slot names are rejected", "[registry][composite]") {
    static const SlotDef bad = SlotDef("__class__");
    REQUIRE_THROWS_AS(CompositeType("tests.Bad", {&bad}, nullptr), RegistrationError);
    REQUIRE_FALSE(TypeRegistry::instance().is_registered("tests.Bad"));
}

TEST_CASE("CompositeType inheritance", "[registry][composite]") {
    REQUIRE(LabeledPoint::type.base() == &Point::type);
    REQUIRE(LabeledPoint::type.is_a(Point::type));
    REQUIRE_FALSE(Point::type.is_a(LabeledPoint::type));

    auto slots = LabeledPoint::type.all_slots();
    REQUIRE(slots.size() == 3);
    REQUIRE(slots[0]->name() == "name");
    REQUIRE(slots[1] == &LabeledPoint::value);
    REQUIRE(slots[2]->name() == "label");

    REQUIRE(LabeledPoint::type.find_slot("value") == &LabeledPoint::value);
    REQUIRE(LabeledPoint::type.declares(Point::name));
    REQUIRE_FALSE(Point::type.declares(LabeledPoint::label));
}

// ============================================================
// Primitive and dataset registration
// ============================================================

TEST_CASE("Built-in primitives", "[registry][primitive]") {
    auto& reg = TypeRegistry::instance();

    REQUIRE(reg.is_primitive<std::nullptr_t>());
    REQUIRE(reg.is_primitive<bool>());
    REQUIRE(reg.is_primitive<int64_t>());
    REQUIRE(reg.is_primitive<double>());
    REQUIRE(reg.is_primitive<std::string>());
    REQUIRE(reg.is_primitive<std::filesystem::path>());

    REQUIRE(reg.find_primitive("int")->builtin);
    REQUIRE(reg.find_primitive(std::type_index(typeid(std::string)))->name == "str");
}

TEST_CASE("User primitive registration", "[registry][primitive]") {
    register_user_types();
    auto& reg = TypeRegistry::instance();

    const PrimitiveCodec* codec = reg.find_primitive("tests.Color");
    REQUIRE(codec != nullptr);
    REQUIRE_FALSE(codec->builtin);

    Object c = Object::wrap(Color{0xff00ff});
    REQUIRE(codec->encode(c).as_int() == 0xff00ff);
    REQUIRE(codec->decode(Value{int64_t{12}}).as<Color>().rgb == 12);

    SECTION("registering again replaces the codec") {
        reg.register_primitive<Color>(
            "tests.Color",
            [](const Color& col) { return Value{col.rgb * 2}; },
            [](const Value& v) { return Color{v.as_int() / 2}; });
        REQUIRE(reg.find_primitive("tests.Color")->encode(c).as_int() == 2 * 0xff00ff);
        register_user_types();
    }

    SECTION("remove") {
        REQUIRE(reg.remove_primitive<Color>());
        REQUIRE_FALSE(reg.remove_primitive<Color>());
        REQUIRE(reg.find_primitive("tests.Color") == nullptr);
        register_user_types();
    }
}

TEST_CASE("Built-in datasets", "[registry][dataset]") {
    auto& reg = TypeRegistry::instance();
    REQUIRE(reg.is_dataset<NdArray>());
    REQUIRE(reg.is_dataset<Timestamp>());
    REQUIRE(reg.is_dataset<TimestampIndex>());
    REQUIRE(reg.find_dataset(std::string_view("objgraph.NdArray")) != nullptr);
}

TEST_CASE("A type cannot be both primitive and dataset", "[registry][dataset]") {
    auto& reg = TypeRegistry::instance();

    reg.register_primitive<Both>(
        "tests.Both",
        [](const Both& b) { return Value{b.v}; },
        [](const Value& v) { return Both{v.as_int()}; });

    REQUIRE_THROWS_AS(
        reg.register_dataset<Both>(
            "tests.BothDataset",
            [](const Both& b) { return Disassembled{NdArray::from<int64_t>({b.v}), Dict{}}; },
            [](NdArray data, const Dict&) { return Both{data.at<int64_t>(0)}; }),
        RegistrationError);

    REQUIRE(reg.is_primitive<Both>());
    REQUIRE_FALSE(reg.is_dataset<Both>());
    REQUIRE(reg.remove_primitive<Both>());
}

// ============================================================
// Classifier
// ============================================================

TEST_CASE("classify", "[classifier]") {
    register_user_types();

    REQUIRE(classify(Object{}) == Category::primitive);
    REQUIRE(classify(Object{1}) == Category::primitive);
    REQUIRE(classify(Object{1.5f}) == Category::primitive);
    REQUIRE(classify(Object{"s"}) == Category::primitive);
    REQUIRE(classify(Object{std::filesystem::path("p")}) == Category::primitive);
    REQUIRE(classify(Object::wrap(Color{1})) == Category::primitive);

    REQUIRE(classify(Object{NdArray::from<double>({1.0})}) == Category::dataset);
    REQUIRE(classify(Object::wrap(Track{})) == Category::dataset);

    REQUIRE(classify(Object{List{1, 2}}) == Category::container);
    REQUIRE(classify(Object{Set{1, 2}}) == Category::container);
    REQUIRE(classify(Object{Dict{{"a", 1}}}) == Category::container);

    REQUIRE(classify(Object{std::make_shared<Point>()}) == Category::composite);

    REQUIRE(classify(Object::wrap(Opaque{})) == Category::unsupported);
    REQUIRE_THROWS_AS(require_category(Object::wrap(Opaque{})), ClassificationError);
}

TEST_CASE("container_kind and names", "[classifier]") {
    REQUIRE(container_kind(Object{List{}}) == ContainerKind::sequence);
    REQUIRE(container_kind(Object{Dict{}}) == ContainerKind::mapping);
    REQUIRE(container_kind(Object{Set{}}) == ContainerKind::set);
    REQUIRE_THROWS_AS(container_kind(Object{1}), ClassificationError);

    REQUIRE(category_name(Category::dataset) == "dataset");
    REQUIRE(container_kind_name(ContainerKind::set) == "set");
}

TEST_CASE("type_name", "[classifier]") {
    register_user_types();

    REQUIRE(type_name(Object{}) == "NoneType");
    REQUIRE(type_name(Object{3}) == "int");
    REQUIRE(type_name(Object{3.0}) == "float");
    REQUIRE(type_name(Object{List{}}) == "list");
    REQUIRE(type_name(Object::wrap(Color{})) == "tests.Color");
    REQUIRE(type_name(Object{std::make_shared<LabeledPoint>()}) == "tests.LabeledPoint");
    REQUIRE_THAT(type_name(Object::wrap(Opaque{})), Catch::Matchers::ContainsSubstring("Opaque"));
}
