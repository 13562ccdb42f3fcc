// test_slot.cpp - Tests for SlotDef configuration and Composite slot access
// Module 4: Attribute slots

#include <catch2/catch_all.hpp>

#include "test_types.h"

using namespace objgraph;
using namespace objgraph::test;

// ============================================================
// SlotDef
// ============================================================

TEST_CASE("SlotDef builders do not mutate the original", "[slot][builders]") {
    const SlotDef base = SlotDef("x").with_default(1);
    const SlotDef derived = base.renamed("y").with_default(2).write_once();

    REQUIRE(base.name() == "x");
    REQUIRE_FALSE(base.is_write_once());
    REQUIRE(derived.name() == "y");
    REQUIRE(derived.is_write_once());
    REQUIRE(derived.is_copiable());
}

TEST_CASE("SlotDef default and factory replace each other", "[slot][builders]") {
    const SlotDef with_factory = SlotDef("x").with_default(1).with_factory([](Composite&) -> Object { return 2; });
    REQUIRE(with_factory.has_factory());
    REQUIRE(with_factory.has_default());

    const SlotDef back_to_static = with_factory.with_default(3);
    REQUIRE_FALSE(back_to_static.has_factory());
    REQUIRE(back_to_static.has_default());

    REQUIRE_FALSE(SlotDef("bare").has_default());
}

TEST_CASE("SlotDef observers keep registration order", "[slot][observers]") {
    const auto noop = [](Composite&, const Object&, const Object&) {};
    const SlotDef s = SlotDef("x")
        .with_observer("a", noop)
        .with_observer("b", noop)
        .with_observer("a", noop);

    REQUIRE(s.observer_keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(s.without_observer("a").observer_keys() == std::vector<std::string>{"b"});
    REQUIRE(s.without_observer("missing").observer_keys().size() == 2);
}

// ============================================================
// Defaults
// ============================================================

TEST_CASE("Unset slots read their default", "[composite][defaults]") {
    auto p = std::make_shared<Point>();

    REQUIRE_FALSE(p->has_value(Point::name));
    REQUIRE(p->get_as<std::string>(Point::name).empty());
    REQUIRE(p->get_as<int64_t>(Point::value) == 0);

    // Seeding is not an assignment
    REQUIRE(p->has_value(Point::name));
    REQUIRE_FALSE(p->is_assigned(Point::name));
}

TEST_CASE("A slot without default reads as null", "[composite][defaults]") {
    auto s = std::make_shared<Sample>();
    REQUIRE(s->get(Sample::id).is_null());
    REQUIRE_FALSE(s->has_value(Sample::id));
}

TEST_CASE("Factory defaults are per instance", "[composite][defaults]") {
    auto a = std::make_shared<Sample>();
    auto b = std::make_shared<Sample>();

    List tags = a->get_as<List>(Sample::tags);
    tags.push_back("x");
    a->set(Sample::tags, tags);

    REQUIRE(a->get_as<List>(Sample::tags).size() == 1);
    REQUIRE(b->get_as<List>(Sample::tags).empty());
}

TEST_CASE("Subtype defaults override base defaults", "[composite][defaults]") {
    auto lp = std::make_shared<LabeledPoint>();
    REQUIRE(lp->get_as<int64_t>("value") == 7);
    REQUIRE(lp->get_as<std::string>("label") == "none");
    REQUIRE(lp->get_as<std::string>("name").empty());
}

// ============================================================
// Assignment
// ============================================================

TEST_CASE("Set and get by slot and by name", "[composite][assign]") {
    auto p = std::make_shared<Point>();
    p->set(Point::name, "origin");
    p->set("value", 5);

    REQUIRE(p->get_as<std::string>("name") == "origin");
    REQUIRE(p->get_as<int64_t>(Point::value) == 5);
    REQUIRE(p->is_assigned(Point::value));
}

TEST_CASE("assign sets every entry", "[composite][assign]") {
    auto p = make<Point>({{"name", "x"}, {"value", 5}});
    REQUIRE(p->get_as<std::string>(Point::name) == "x");
    REQUIRE(p->get_as<int64_t>(Point::value) == 5);
}

TEST_CASE("Unknown slots", "[composite][assign]") {
    auto p = std::make_shared<Point>();
    REQUIRE_THROWS_AS(p->set("nope", 1), SlotError);
    REQUIRE_THROWS_AS(p->get("nope"), SlotError);
    REQUIRE_THROWS_AS(p->get(Sample::label), SlotError);
    REQUIRE_THROWS_AS(make<Point>({{"nope", 1}}), SlotError);
}

TEST_CASE("Parsers transform and validate", "[composite][parser]") {
    auto s = std::make_shared<Sample>();

    s->set(Sample::label, 42);
    REQUIRE(s->get_as<std::string>(Sample::label) == "#42");

    s->set(Sample::label, "plain");
    REQUIRE(s->get_as<std::string>(Sample::label) == "plain");

    REQUIRE_THROWS_AS(s->set(Sample::label, 1.5), ValidationError);
    REQUIRE(s->get_as<std::string>(Sample::label) == "plain");
}

TEST_CASE("Observers run after every store", "[composite][observers]") {
    auto s = std::make_shared<Sample>();
    REQUIRE(s->get_as<int64_t>(Sample::changes) == 0);

    s->set(Sample::label, "a");
    s->set(Sample::label, "b");
    REQUIRE(s->get_as<int64_t>(Sample::changes) == 2);

    SECTION("rejected values do not notify") {
        REQUIRE_THROWS(s->set(Sample::label, List{}));
        REQUIRE(s->get_as<int64_t>(Sample::changes) == 2);
    }
}

TEST_CASE("Observers receive previous and new values", "[composite][observers]") {
    static std::vector<std::pair<Object, Object>> seen;
    seen.clear();

    static const SlotDef watched = SlotDef("watched")
        .with_default(0)
        .with_observer("record", [](Composite&, const Object& previous, const Object& current) {
            seen.emplace_back(previous, current);
        });

    class Watched : public Composite {
    public:
        Watched() : Composite(descriptor()) {}
        static const CompositeType& descriptor() {
            static const CompositeType t{"tests.Watched", {&watched}, make_factory<Watched>()};
            return t;
        }
    };

    auto w = std::make_shared<Watched>();
    w->set(watched, 1);
    w->set(watched, 2);

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].first.is_null());
    REQUIRE(seen[0].second == Object{1});
    REQUIRE(seen[1].first == Object{1});
    REQUIRE(seen[1].second == Object{2});
}

// ============================================================
// Write-once
// ============================================================

TEST_CASE("Write-once slots reject a second assignment", "[composite][write_once]") {
    auto s = std::make_shared<Sample>();
    s->set(Sample::id, "abc");

    REQUIRE_THROWS_AS(s->set(Sample::id, "def"), ImmutabilityError);
    REQUIRE(s->get_as<std::string>(Sample::id) == "abc");

    try {
        s->set(Sample::id, "def");
    } catch (const ImmutabilityError& e) {
        REQUIRE(e.slot() == "id");
    }
}

TEST_CASE("Reading a write-once slot does not lock it", "[composite][write_once]") {
    static const SlotDef once = SlotDef("once").with_default(5).write_once();

    class Locked : public Composite {
    public:
        Locked() : Composite(descriptor()) {}
        static const CompositeType& descriptor() {
            static const CompositeType t{"tests.Locked", {&once}, make_factory<Locked>()};
            return t;
        }
    };

    auto l = std::make_shared<Locked>();
    REQUIRE(l->get_as<int64_t>(once) == 5);
    l->set(once, 6);
    REQUIRE(l->get_as<int64_t>(once) == 6);
    REQUIRE_THROWS_AS(l->set(once, 7), ImmutabilityError);
}

// ============================================================
// Post-init
// ============================================================

TEST_CASE("Post-init runs once before the first read", "[composite][post_init]") {
    auto s = std::make_shared<Sample>();
    s->set(Sample::label, "base");

    REQUIRE(s->get_as<std::string>(Sample::derived) == "from base");

    s->set(Sample::label, "changed");
    REQUIRE(s->get_as<std::string>(Sample::derived) == "from base");
}

TEST_CASE("Post-init is skipped when the slot was assigned", "[composite][post_init]") {
    auto s = std::make_shared<Sample>();
    s->set(Sample::derived, "explicit");
    REQUIRE(s->get_as<std::string>(Sample::derived) == "explicit");
}
