#include <catch2/catch.hpp>
#include <memory>
#include "storage/table.h"
#include "types.h"

using namespace eqjoin;

TEST_CASE("ColumnVector smoke test", "[columnar]") {
    ColumnVector<i64> col(10);

    for (i64 i = 0; i < 5; ++i) {
        col.append(i * 10);
    }

    REQUIRE(col.size() == 5);
    REQUIRE(col.type() == TypeId::INT64);
    REQUIRE(col.data[0] == 0);
    REQUIRE(col.data[4] == 40);
    REQUIRE_FALSE(col.is_null(3));
}

TEST_CASE("ColumnVector tracks nulls lazily", "[columnar]") {
    ColumnVector<f64> col;
    col.append(1.5);
    REQUIRE(col.nulls.empty());

    col.append_null();
    col.append(2.5);

    REQUIRE(col.size() == 3);
    REQUIRE(col.nulls.size() == 3);
    REQUIRE_FALSE(col.is_null(0));
    REQUIRE(col.is_null(1));
    REQUIRE_FALSE(col.is_null(2));
}

TEST_CASE("ColumnVector rejects a short null mask", "[columnar]") {
    REQUIRE_THROWS_AS(ColumnVector<i64>(std::vector<i64>{1, 2}, std::vector<uint8_t>{0}), std::runtime_error);
}

TEST_CASE("Table resolves columns by name", "[columnar]") {
    Table table;
    table.dict = std::make_shared<Dictionary>();
    table.columns.push_back({"id", std::make_unique<ColumnVector<i64>>(std::vector<i64>{1, 2, 3})});
    table.columns.push_back({"name", std::make_unique<ColumnVector<std::string>>(std::vector<std::string>{"a", "b", "c"})});

    REQUIRE(table.num_rows() == 3);
    REQUIRE(table.get_column_index("name") == 1);
    REQUIRE(table.get_column_data("name")->type() == TypeId::TEXT);
    REQUIRE_THROWS_AS(table.get_column_index("missing"), std::runtime_error);
}

TEST_CASE("Dictionary assigns stable ids", "[columnar]") {
    Dictionary dict;
    StrId north = dict.get_or_add("north");
    StrId south = dict.get_or_add("south");
    REQUIRE(dict.get_or_add("north") == north);
    REQUIRE(north != south);
    REQUIRE(dict.get(south) == "south");
    REQUIRE(dict.size() == 2);
    REQUIRE_THROWS_AS(dict.get(7), std::out_of_range);
}
