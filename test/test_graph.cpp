// test_graph.cpp - Tests for serialize/deserialize, structural equality and copy
// Module 5: Object graph conversion

#include <catch2/catch_all.hpp>
#include <objgraph/datasets.h>
#include <objgraph/graph.h>

#include "test_types.h"

using namespace objgraph;
using namespace objgraph::test;

// ============================================================
// Serialization
// ============================================================

TEST_CASE("Composite serializes to a tagged map", "[graph][serialize]") {
    auto p = make<Point>({{"name", "x"}, {"value", 5}});

    Value node = serialize(Object{p});
    REQUIRE(node.is_map());
    REQUIRE(node.at(keys::class_tag).as_string() == "tests.Point");
    REQUIRE(node.at("name").as_string() == "x");
    REQUIRE(node.at("value").as_int() == 5);
    REQUIRE(node.size() == 3);

    auto back = make_from<Point>(node);
    REQUIRE(back != nullptr);
    REQUIRE(back.get() != p.get());
    REQUIRE(back->get_as<std::string>(Point::name) == "x");
    REQUIRE(back->get_as<int64_t>(Point::value) == 5);
}

TEST_CASE("Unset slots serialize their default", "[graph][serialize]") {
    Value node = serialize(Object{std::make_shared<LabeledPoint>()});
    REQUIRE(node.at("value").as_int() == 7);
    REQUIRE(node.at("label").as_string() == "none");
}

TEST_CASE("Builtin primitives serialize verbatim", "[graph][serialize]") {
    REQUIRE(serialize(Object{}).is_null());
    REQUIRE(serialize(Object{true}).as_bool());
    REQUIRE(serialize(Object{int16_t{-3}}).as_int() == -3);
    REQUIRE(serialize(Object{0.5}).as_double() == 0.5);
    REQUIRE(serialize(Object{"s"}).as_string() == "s");
    REQUIRE(serialize(Object{std::filesystem::path("a/b")}).as_path() == std::filesystem::path("a/b"));
}

TEST_CASE("User primitives serialize as tagged maps", "[graph][serialize]") {
    register_user_types();

    Value node = serialize(Object::wrap(Color{0x123456}));
    REQUIRE(node.at(keys::primitive).as_string() == "tests.Color");
    REQUIRE(node.at(keys::value).as_int() == 0x123456);

    Object back = deserialize(node);
    REQUIRE(back.as<Color>() == Color{0x123456});
}

TEST_CASE("Datasets serialize to array plus metadata", "[graph][serialize]") {
    register_user_types();

    Track track{NdArray::from<double>({1.0, 2.0, 3.0}), "m"};
    Value node = serialize(Object::wrap(track));

    REQUIRE(node.at(keys::dataset).as_string() == "tests.Track");
    REQUIRE(node.at(keys::data).as_ndarray()->shape() == Shape{3});
    REQUIRE(node.at("unit").as_string() == "m");

    Object back = deserialize(node);
    REQUIRE(back.as<Track>() == track);
}

TEST_CASE("Containers", "[graph][serialize]") {
    SECTION("list becomes a vector") {
        Value node = serialize(Object{List{1, "a", List{}}});
        REQUIRE(node.is_vector());
        REQUIRE(node.size() == 3);
        REQUIRE(node.at(std::size_t{2}).is_vector());
    }

    SECTION("dict becomes a plain map") {
        Value node = serialize(Object{Dict{{"k", 1}}});
        REQUIRE(node == Value::map({{"k", 1}}));
        REQUIRE(deserialize(node).as<Dict>().at("k") == Object{1});
    }

    SECTION("set is tagged") {
        Value node = serialize(Object{Set{1, 2, 2}});
        REQUIRE(node.at(keys::container).as_string() == "set");
        REQUIRE(node.at(keys::items).size() == 2);

        Object back = deserialize(node);
        REQUIRE(back.is<Set>());
        REQUIRE(back == Object{Set{2, 1}});
    }

    SECTION("reserved dict keys are rejected") {
        REQUIRE_THROWS_AS(serialize(Object{Dict{{"__class__", 1}}}), ValidationError);
        REQUIRE_THROWS_AS(serialize(Object{List{Dict{{"__dataset__", 1}}}}), ValidationError);
    }
}

TEST_CASE("Unsupported values cannot be serialized", "[graph][serialize]") {
    struct Unknown {};
    REQUIRE_THROWS_AS(serialize(Object::wrap(Unknown{})), ClassificationError);
    REQUIRE_THROWS_AS(serialize(Object{List{Object::wrap(Unknown{})}}), ClassificationError);
}

// ============================================================
// Deserialization
// ============================================================

TEST_CASE("Unknown tags are fatal", "[graph][deserialize]") {
    REQUIRE_THROWS_AS(deserialize(Value::map({{keys::class_tag, "tests.Missing"}})), ResolutionError);
    REQUIRE_THROWS_AS(deserialize(Value::map({{keys::primitive, "tests.Missing"}, {keys::value, 1}})),
                      ResolutionError);
    REQUIRE_THROWS_AS(
        deserialize(Value::map({{keys::dataset, "tests.Missing"}, {keys::data, NdArray::from<int32_t>({1})}})),
        ResolutionError);
    REQUIRE_THROWS_AS(deserialize(Value::map({{keys::container, "deque"}, {keys::items, Value::vector({})}})),
                      ResolutionError);
}

TEST_CASE("Nested unknown tag aborts the whole graph", "[graph][deserialize]") {
    Value node = Value::map({
        {keys::class_tag, "tests.Experiment"},
        {"points", Value::vector({Value::map({{keys::class_tag, "tests.Missing"}})})},
    });
    REQUIRE_THROWS_AS(deserialize(node), ResolutionError);
}

TEST_CASE("Keys that name no slot are skipped", "[graph][deserialize]") {
    Value node = Value::map({{keys::class_tag, "tests.Point"}, {"value", 3}, {"obsolete", "x"}});
    auto p = make_from<Point>(node);
    REQUIRE(p->get_as<int64_t>(Point::value) == 3);
    REQUIRE_FALSE(p->is_assigned(Point::name));
}

TEST_CASE("make_from checks the resulting type", "[graph][deserialize]") {
    Value node = serialize(Object{std::make_shared<Point>()});
    REQUIRE_THROWS_AS(make_from<Sample>(node), ResolutionError);

    Value derived = serialize(Object{std::make_shared<LabeledPoint>()});
    REQUIRE(make_from<Point>(derived) != nullptr);
}

TEST_CASE("Deserialization runs parsers and observers", "[graph][deserialize]") {
    Value node = Value::map({{keys::class_tag, "tests.Sample"}, {"label", 9}});
    auto s = make_from<Sample>(node);
    REQUIRE(s->get_as<std::string>(Sample::label) == "#9");
    REQUIRE(s->get_as<int64_t>(Sample::changes) == 1);
}

TEST_CASE("Dataset hook takes precedence", "[graph][deserialize]") {
    register_user_types();
    Value node = serialize(Object{List{Object::wrap(Track{NdArray::from<int32_t>({1}), "s"}), NdArray()}});

    int calls = 0;
    DatasetHook hook = [&](const Value& dataset) -> Object {
        ++calls;
        if (dataset.at(keys::dataset).as_string() == "tests.Track") return Object{"replaced"};
        return Object{};
    };

    List result = deserialize(node, hook).as<List>();
    REQUIRE(calls == 2);
    REQUIRE(result[0] == Object{"replaced"});
    REQUIRE(result[1].is<NdArray>());
}

// ============================================================
// Equality and copy
// ============================================================

TEST_CASE("Structural equality", "[graph][equal]") {
    auto a = make<Point>({{"name", "x"}, {"value", 1}});
    auto b = make<Point>({{"name", "x"}, {"value", 1}});
    auto c = make<Point>({{"name", "x"}, {"value", 2}});

    REQUIRE(equal(Object{a}, Object{b}));
    REQUIRE_FALSE(equal(Object{a}, Object{c}));
    REQUIRE_FALSE(equal(Object{a}, Object{make<LabeledPoint>({{"name", "x"}, {"value", 1}})}));

    REQUIRE(Object{1} != Object{1.0});
    REQUIRE(Object{List{1, 2}} != Object{List{2, 1}});
    REQUIRE(Object{Set{1, 2}} == Object{Set{2, 1}});
    REQUIRE(Object{} == Object{nullptr});
}

TEST_CASE("Equality ignores non-copiable slots", "[graph][equal]") {
    auto a = std::make_shared<Sample>();
    auto b = std::make_shared<Sample>();
    a->set(Sample::cache, Dict{{"hits", 3}});
    REQUIRE(equal(Object{a}, Object{b}));
}

TEST_CASE("copy produces an independent graph", "[graph][copy]") {
    auto inner = make<Point>({{"name", "inner"}});
    auto e = make<Experiment>({{"title", "run"}, {"points", List{inner}}, {"data", NdArray::from<int32_t>({1, 2})}});

    auto c = copy(e);
    REQUIRE(c != nullptr);
    REQUIRE(c.get() != e.get());
    REQUIRE(equal(Object{c}, Object{e}));

    auto copied_inner = c->get_as<List>(Experiment::points)[0].composite_as<Point>();
    REQUIRE(copied_inner.get() != inner.get());

    copied_inner->set(Point::name, "changed");
    REQUIRE(inner->get_as<std::string>(Point::name) == "inner");
}

TEST_CASE("copy drops non-copiable slots", "[graph][copy]") {
    auto s = std::make_shared<Sample>();
    s->set(Sample::id, "one");
    s->set(Sample::cache, Dict{{"hits", 3}});

    Value node = serialize(Object{s}, true);
    REQUIRE_FALSE(node.contains("cache"));
    REQUIRE(serialize(Object{s}).contains("cache"));

    auto c = copy(s);
    REQUIRE(c->get_as<std::string>(Sample::id) == "one");
    REQUIRE(c->get_as<Dict>(Sample::cache).empty());
}
