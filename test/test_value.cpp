// test_value.cpp - Tests for Value construction, access, builders and NdArray
// Module 1: Nested value form

#include <catch2/catch_all.hpp>
#include <objgraph/builders.h>
#include <objgraph/ndarray.h>
#include <objgraph/value.h>

using namespace objgraph;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.is_scalar());
    REQUIRE(v.size() == 0);
}

TEST_CASE("Value scalar construction", "[value][construction]") {
    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is_bool());
        REQUIRE(v.as_bool() == true);
    }

    SECTION("int32 widens to int64") {
        Value v{42};
        REQUIRE(v.is_int());
        REQUIRE(v.as_int() == 42);
    }

    SECTION("int64") {
        Value v{int64_t{9999999999LL}};
        REQUIRE(v.is_int());
        REQUIRE(v.as_int() == 9999999999LL);
    }

    SECTION("double") {
        Value v{2.5};
        REQUIRE(v.is_double());
        REQUIRE(v.as_double() == 2.5);
        REQUIRE(v.as_number() == 2.5);
    }

    SECTION("string from literal") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
        REQUIRE(v.as_string_view() == "hello");
    }

    SECTION("path") {
        Value v{std::filesystem::path("/tmp/run.h5")};
        REQUIRE(v.is_path());
        REQUIRE(v.as_path() == std::filesystem::path("/tmp/run.h5"));
        REQUIRE_FALSE(v.is_string());
    }

    SECTION("ndarray") {
        Value v{NdArray::from<double>({1.0, 2.0})};
        REQUIRE(v.is_ndarray());
        REQUIRE_FALSE(v.is_scalar());
        REQUIRE(v.as_ndarray()->size() == 2);
    }
}

TEST_CASE("Value container factories", "[value][construction]") {
    Value m = Value::map({{"a", 1}, {"b", "two"}});
    REQUIRE(m.is_map());
    REQUIRE(m.size() == 2);
    REQUIRE(m.at("a").as_int() == 1);
    REQUIRE(m.at("b").as_string() == "two");

    Value v = Value::vector({1, 2.0, "three"});
    REQUIRE(v.is_vector());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at(std::size_t{1}).as_double() == 2.0);
}

// ============================================================
// Access Tests
// ============================================================

TEST_CASE("Value access with defaults", "[value][access]") {
    Value m = Value::map({{"x", 1}});

    REQUIRE(m.at("missing").is_null());
    REQUIRE(m.at_or("missing", Value{5}).as_int() == 5);
    REQUIRE(m.at(std::size_t{0}).is_null());
    REQUIRE(Value{"text"}.as_int(-1) == -1);
    REQUIRE(Value{}.get_or<std::string>("fallback") == "fallback");
    REQUIRE(Value{1}.as_ndarray() == nullptr);
}

TEST_CASE("Value contains and count", "[value][access]") {
    Value m = Value::map({{"x", 1}});
    REQUIRE(m.contains("x"));
    REQUIRE_FALSE(m.contains("y"));
    REQUIRE(m.count("x") == 1);

    Value v = Value::vector({1, 2});
    REQUIRE(v.contains(std::size_t{1}));
    REQUIRE_FALSE(v.contains(std::size_t{2}));
}

TEST_CASE("Value set is persistent", "[value][modification]") {
    Value original = Value::map({{"x", 1}});
    Value updated = original.set("x", 2);

    REQUIRE(original.at("x").as_int() == 1);
    REQUIRE(updated.at("x").as_int() == 2);

    SECTION("set on null creates a map") {
        Value created = Value{}.set("k", "v");
        REQUIRE(created.is_map());
        REQUIRE(created.at("k").as_string() == "v");
    }

    SECTION("vector set out of range is a no-op") {
        Value v = Value::vector({1});
        REQUIRE(v.set(std::size_t{5}, 9) == v);
    }
}

TEST_CASE("Value equality", "[value][comparison]") {
    REQUIRE(Value{1} == Value{1});
    REQUIRE_FALSE(Value{1} == Value{1.0});
    REQUIRE(Value::map({{"a", 1}}) == Value::map({{"a", 1}}));
    REQUIRE_FALSE(Value::map({{"a", 1}}) == Value::map({{"a", 2}}));
    REQUIRE(Value{NdArray::from<int32_t>({1, 2})} == Value{NdArray::from<int32_t>({1, 2})});
    REQUIRE_FALSE(Value{NdArray::from<int32_t>({1, 2})} == Value{NdArray::from<int64_t>({1, 2})});
}

TEST_CASE("value_to_string", "[value][debug]") {
    REQUIRE(value_to_string(Value{}) == "null");
    REQUIRE(value_to_string(Value{true}) == "true");
    REQUIRE(value_to_string(Value{42}) == "42");
}

// ============================================================
// Builder Tests
// ============================================================

TEST_CASE("MapBuilder", "[builders]") {
    MapBuilder builder;
    builder.set("a", 1).set("b", "two");
    REQUIRE(builder.contains("a"));
    REQUIRE(builder.size() == 2);
    REQUIRE(builder.get("b").as_string() == "two");
    REQUIRE(builder.get("zzz", Value{0}).as_int() == 0);

    builder.update_at("a", [](Value old) { return Value{old.as_int() + 10}; });
    builder.update_at("missing", [](Value) { return Value{99}; });

    Value result = builder.finish();
    REQUIRE(result.at("a").as_int() == 11);
    REQUIRE_FALSE(result.contains("missing"));
}

TEST_CASE("MapBuilder continues an existing map", "[builders]") {
    Value base = Value::map({{"a", 1}});
    Value extended = MapBuilder(base).set("b", 2).finish();
    REQUIRE(extended.size() == 2);
    REQUIRE(base.size() == 1);
}

TEST_CASE("VectorBuilder", "[builders]") {
    VectorBuilder builder;
    builder.push_back(1).push_back("two").push_back(3.0);
    REQUIRE(builder.size() == 3);
    builder.set(0, 10);

    Value result = builder.finish();
    REQUIRE(result.size() == 3);
    REQUIRE(result.at(std::size_t{0}).as_int() == 10);
    REQUIRE(result.at(std::size_t{2}).as_double() == 3.0);
}

// ============================================================
// NdArray Tests
// ============================================================

TEST_CASE("NdArray construction", "[ndarray]") {
    SECTION("default is empty float64") {
        NdArray a;
        REQUIRE(a.dtype() == DType::float64);
        REQUIRE(a.shape() == Shape{0});
        REQUIRE(a.size() == 0);
    }

    SECTION("zero filled") {
        NdArray a(DType::int32, {2, 3});
        REQUIRE(a.size() == 6);
        REQUIRE(a.nbytes() == 24);
        for (std::size_t i = 0; i < a.size(); ++i) {
            REQUIRE(a.at<int32_t>(i) == 0);
        }
    }

    SECTION("scalar is 0-d") {
        NdArray a = NdArray::scalar(3.5);
        REQUIRE(a.ndim() == 0);
        REQUIRE(a.size() == 1);
        REQUIRE(a.at<double>(0) == 3.5);
    }

    SECTION("from values with shape") {
        NdArray a = NdArray::from<double>({1, 2, 3, 4, 5, 6}, {2, 3});
        REQUIRE(a.shape() == Shape{2, 3});
        REQUIRE(a.at<double>(5) == 6.0);
    }

    SECTION("value count must fill the shape") {
        REQUIRE_THROWS_AS(NdArray::from<double>({1, 2, 3}, {2, 2}), StorageShapeError);
    }
}

TEST_CASE("NdArray rows and reshaping", "[ndarray]") {
    NdArray a = NdArray::from<int64_t>({1, 2, 3, 4, 5, 6}, {3, 2});

    NdArray r = a.row(1);
    REQUIRE(r.shape() == Shape{2});
    REQUIRE(r.at<int64_t>(0) == 3);
    REQUIRE(r.at<int64_t>(1) == 4);

    NdArray flat = a.reshaped({6});
    REQUIRE(flat.shape() == Shape{6});
    REQUIRE(flat.values<int64_t>()[5] == 6);

    REQUIRE_THROWS(a.reshaped({4}));
    REQUIRE_THROWS(a.row(3));
}

TEST_CASE("NdArray typed access", "[ndarray]") {
    NdArray a = NdArray::from<float>({1.5f, 2.5f});
    REQUIRE(a.dtype() == DType::float32);
    REQUIRE(a.values<float>()[1] == 2.5f);
    REQUIRE_THROWS_AS(a.values<double>(), Error);
    REQUIRE(a.at<int64_t>(1) == 2);
}

TEST_CASE("NdArray astype", "[ndarray]") {
    NdArray a = NdArray::from<int32_t>({1, -2, 3});
    NdArray d = a.astype(DType::float64);
    REQUIRE(d.dtype() == DType::float64);
    REQUIRE(d.values<double>()[1] == -2.0);
    REQUIRE(d.astype(DType::int32) == a);
}

TEST_CASE("dtype names", "[ndarray]") {
    REQUIRE(dtype_name(DType::uint16) == "uint16");
    REQUIRE(parse_dtype("float32") == DType::float32);
    REQUIRE_FALSE(parse_dtype("complex64").has_value());
    REQUIRE(dtype_size(DType::int64) == 8);
    REQUIRE(shape_to_string({2, 3}) == "(2, 3)");
}
