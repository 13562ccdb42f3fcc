// test_array_proxy.cpp - Tests for reads, writes and resizing through ArrayProxy
// Module 8: Lazy array leaves

#include <catch2/catch_all.hpp>
#include <objgraph/store.h>

#include <filesystem>
#include <string>

using namespace objgraph;

namespace {

/// Store file holding {"grid": int32[3, 2], "flat": float64[4], "point": 0-d}
class ProxyFixture {
public:
    ProxyFixture()
        : path_(std::filesystem::temp_directory_path() / "objgraph_array_proxy.h5")
    {
        std::filesystem::remove(path_);
        save(Object{Dict{
                 {"grid", NdArray::from<int32_t>({1, 2, 3, 4, 5, 6}, {3, 2})},
                 {"flat", NdArray::from<double>({0.5, 1.5, 2.5, 3.5})},
                 {"point", NdArray::scalar(9.0)},
             }},
             path_);
    }

    ~ProxyFixture()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

// ============================================================
// Reads
// ============================================================

TEST_CASE_METHOD(ProxyFixture, "Proxy metadata", "[array_proxy][read]") {
    Session s(path());
    ArrayProxy grid = s.array("/grid");

    REQUIRE(grid.path() == "/grid");
    REQUIRE(grid.shape() == Shape{3, 2});
    REQUIRE(grid.dtype() == DType::int32);
    REQUIRE(grid.ndim() == 2);
    REQUIRE(grid.size() == 6);
    REQUIRE(grid.nbytes() == 24);
    REQUIRE(grid.read_only());
    REQUIRE(grid.attrs().empty());
}

TEST_CASE_METHOD(ProxyFixture, "Proxy reads", "[array_proxy][read]") {
    Session s(path());
    ArrayProxy grid = s.array("grid");

    SECTION("whole array") {
        REQUIRE(grid.read() == NdArray::from<int32_t>({1, 2, 3, 4, 5, 6}, {3, 2}));
    }

    SECTION("one row") {
        NdArray row = grid.read(std::size_t{1});
        REQUIRE(row.shape() == Shape{2});
        REQUIRE(row.values<int32_t>() == std::vector<int32_t>{3, 4});
    }

    SECTION("slice") {
        NdArray rows = grid.read(Slice{1, 3});
        REQUIRE(rows.shape() == Shape{2, 2});
        REQUIRE(rows.values<int32_t>() == std::vector<int32_t>{3, 4, 5, 6});

        REQUIRE(grid.read(Slice{2, 2}).shape() == Shape{0, 2});
    }

    SECTION("out of range") {
        REQUIRE_THROWS_AS(grid.read(std::size_t{3}), StorageShapeError);
        REQUIRE_THROWS_AS(grid.read(Slice{0, 4}), StorageShapeError);
    }
}

TEST_CASE_METHOD(ProxyFixture, "0-d leaves have no rows", "[array_proxy][read]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy point = s.array("/point");

    REQUIRE(point.ndim() == 0);
    REQUIRE(point.read().at<double>(0) == 9.0);
    REQUIRE_THROWS_AS(point.read(std::size_t{0}), StorageShapeError);
    REQUIRE_THROWS_AS(point.resize(2), StorageShapeError);
    REQUIRE_THROWS_AS(point.append(NdArray::scalar(1.0)), StorageShapeError);

    point.assign(NdArray::scalar(4.0));
    REQUIRE(point.read().at<double>(0) == 4.0);
    REQUIRE_THROWS_AS(point.assign(NdArray::from<double>({1.0, 2.0})), StorageShapeError);
}

// ============================================================
// Writes
// ============================================================

TEST_CASE_METHOD(ProxyFixture, "Row writes grow the leading axis", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy flat = s.array("/flat");

    flat.write(1, NdArray::scalar(10.0));
    REQUIRE(flat.read(std::size_t{1}).at<double>(0) == 10.0);

    flat.write(6, NdArray::scalar(7.0));
    REQUIRE(flat.shape() == Shape{7});
    REQUIRE(flat.read().values<double>() == std::vector<double>{0.5, 10.0, 2.5, 3.5, 0.0, 0.0, 7.0});
}

TEST_CASE_METHOD(ProxyFixture, "Row shape must match", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy grid = s.array("/grid");

    grid.write(0, NdArray::from<int32_t>({9, 9}));
    REQUIRE(grid.read(std::size_t{0}).values<int32_t>() == std::vector<int32_t>{9, 9});

    REQUIRE_THROWS_AS(grid.write(0, NdArray::from<int32_t>({1, 2, 3})), StorageShapeError);
    REQUIRE_THROWS_AS(grid.write(Slice{0, 2}, NdArray::from<int32_t>({1, 2})), StorageShapeError);
}

TEST_CASE_METHOD(ProxyFixture, "Slice writes", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy grid = s.array("/grid");

    grid.write(Slice{2, 4}, NdArray::from<int32_t>({50, 60, 70, 80}, {2, 2}));
    REQUIRE(grid.shape() == Shape{4, 2});
    REQUIRE(grid.read(Slice{2, 4}).values<int32_t>() == std::vector<int32_t>{50, 60, 70, 80});
    REQUIRE(grid.read(std::size_t{1}).values<int32_t>() == std::vector<int32_t>{3, 4});
}

TEST_CASE_METHOD(ProxyFixture, "Writes convert to the leaf dtype", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy flat = s.array("/flat");

    flat.write(0, NdArray::scalar(int64_t{3}));
    REQUIRE(flat.dtype() == DType::float64);
    REQUIRE(flat.read(std::size_t{0}).at<double>(0) == 3.0);
}

TEST_CASE_METHOD(ProxyFixture, "append", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy grid = s.array("/grid");

    SECTION("a single row") {
        grid.append(NdArray::from<int32_t>({7, 8}));
        REQUIRE(grid.shape() == Shape{4, 2});
        REQUIRE(grid.read(std::size_t{3}).values<int32_t>() == std::vector<int32_t>{7, 8});
    }

    SECTION("a block of rows") {
        grid.append(NdArray::from<int32_t>({7, 8, 9, 10}, {2, 2}));
        REQUIRE(grid.shape() == Shape{5, 2});
        REQUIRE(grid.read(std::size_t{4}).values<int32_t>() == std::vector<int32_t>{9, 10});
    }

    SECTION("mismatched rows") {
        REQUIRE_THROWS_AS(grid.append(NdArray::from<int32_t>({1, 2, 3})), StorageShapeError);
        REQUIRE(grid.shape() == Shape{3, 2});
    }
}

TEST_CASE_METHOD(ProxyFixture, "resize and assign", "[array_proxy][write]") {
    Session s(path(), FileMode::read_write);
    ArrayProxy flat = s.array("/flat");

    SECTION("resize grows with zeros") {
        flat.resize(6);
        REQUIRE(flat.read().values<double>() == std::vector<double>{0.5, 1.5, 2.5, 3.5, 0.0, 0.0});
    }

    SECTION("resize shrinks") {
        flat.resize(2);
        REQUIRE(flat.read().values<double>() == std::vector<double>{0.5, 1.5});
    }

    SECTION("assign replaces and grows") {
        flat.assign(NdArray::from<double>({1, 2, 3, 4, 5}));
        REQUIRE(flat.shape() == Shape{5});
        REQUIRE(flat.read(std::size_t{4}).at<double>(0) == 5.0);
    }

    SECTION("assign never shrinks") {
        REQUIRE_THROWS_AS(flat.assign(NdArray::from<double>({1, 2})), StorageShapeError);
        REQUIRE(flat.shape() == Shape{4});
    }

    SECTION("changes persist after the session closes") {
        flat.append(NdArray::scalar(4.5));
        s.close();
        NdArray stored = load(path()).as<Dict>().at("flat").as<NdArray>();
        REQUIRE(stored.values<double>() == std::vector<double>{0.5, 1.5, 2.5, 3.5, 4.5});
    }
}

// ============================================================
// Access control
// ============================================================

TEST_CASE_METHOD(ProxyFixture, "Read-only proxies reject writes", "[array_proxy][access]") {
    Session s(path(), FileMode::read_only);
    ArrayProxy flat = s.array("/flat");

    REQUIRE_THROWS_AS(flat.write(0, NdArray::scalar(1.0)), ReadOnlyError);
    REQUIRE_THROWS_AS(flat.append(NdArray::scalar(1.0)), ReadOnlyError);
    REQUIRE_THROWS_AS(flat.resize(10), ReadOnlyError);
    REQUIRE_THROWS_AS(flat.assign(NdArray::from<double>({1, 2, 3, 4})), ReadOnlyError);
    REQUIRE(flat.shape() == Shape{4});
}

TEST_CASE_METHOD(ProxyFixture, "Proxies outlive their session only as errors", "[array_proxy][access]") {
    auto open_proxy = [this] {
        Session s(path(), FileMode::read_write);
        return s.array("/flat");
    };

    ArrayProxy stale = open_proxy();
    REQUIRE_THROWS_AS(stale.shape(), StorageError);
    REQUIRE_THROWS_AS(stale.read(), StorageError);
    REQUIRE_THROWS_AS(stale.resize(1), StorageError);
}

TEST_CASE_METHOD(ProxyFixture, "Leaf attributes", "[array_proxy][attrs]") {
    {
        Session s(path(), FileMode::read_write);
        s.set_attribute("/flat", "unit", "V");
        s.set_attribute("/flat", "gain", 2.0);
    }

    Session s(path());
    Dict attrs = s.array("/flat").attrs();
    REQUIRE(attrs.size() == 2);
    REQUIRE(attrs.at("unit") == Object{"V"});
    REQUIRE(attrs.at("gain") == Object{2.0});
}
