#include <catch2/catch.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "storage/csv_loader.h"
#include "types.h"

using namespace eqjoin;

TEST_CASE("CSV load test", "[csv]") {
    // Create a temporary CSV file
    std::ofstream csv_file("test_load.csv");
    csv_file << "id,name,value,day\n";
    csv_file << "1,Alice,100.5,20240101\n";
    csv_file << "2,Bob,200.25,20240102\n";
    csv_file << "3,Charlie,300.75,20240103\n";
    csv_file.close();

    Table table = load_csv("test_load.csv");

    REQUIRE(table.name == "test_load.csv");
    REQUIRE(table.num_rows() == 3);
    REQUIRE(table.columns.size() == 4);

    REQUIRE(table.columns[0].name == "id");
    REQUIRE(table.columns[0].data->type() == TypeId::INT64);
    REQUIRE(table.columns[1].data->type() == TypeId::STRING);
    REQUIRE(table.columns[2].data->type() == TypeId::DOUBLE);
    REQUIRE(table.columns[3].data->type() == TypeId::DATE32);

    // Check dictionary
    REQUIRE(table.dict->get(0) == "Alice");
    REQUIRE(table.dict->get(1) == "Bob");
    REQUIRE(table.dict->get(2) == "Charlie");

    // Clean up
    std::remove("test_load.csv");
}

TEST_CASE("CSV empty cells load as nulls", "[csv]") {
    std::istringstream input("id,qty\n1,\n,20\n3,30\n");
    Table table = load_csv(input);

    const Column& id = *table.columns[0].data;
    const Column& qty = *table.columns[1].data;
    REQUIRE(id.type() == TypeId::INT64);
    REQUIRE(qty.type() == TypeId::INT64);
    REQUIRE(id.is_null(1));
    REQUIRE_FALSE(id.is_null(0));
    REQUIRE(qty.is_null(0));
    REQUIRE_FALSE(qty.is_null(2));
}

TEST_CASE("CSV tables can share a dictionary", "[csv]") {
    CsvOptions options;
    options.dict = std::make_shared<Dictionary>();
    std::istringstream first("region\nnorth\nsouth\n");
    std::istringstream second("region\nsouth\nwest\n");

    Table a = load_csv(first, options);
    Table b = load_csv(second, options);

    REQUIRE(a.dict == b.dict);
    const auto& a_ids = dynamic_cast<const ColumnVector<StrId>&>(*a.columns[0].data).data;
    const auto& b_ids = dynamic_cast<const ColumnVector<StrId>&>(*b.columns[0].data).data;
    REQUIRE(a_ids[1] == b_ids[0]);
    REQUIRE(options.dict->size() == 3);
}

TEST_CASE("CSV strings load inline when dictionary encoding is off", "[csv]") {
    CsvOptions options;
    options.dictionary_encode = false;
    std::istringstream input("name\nAlice\n\n");
    Table table = load_csv(input, options);

    REQUIRE(table.columns[0].data->type() == TypeId::TEXT);
    const auto& names = dynamic_cast<const ColumnVector<std::string>&>(*table.columns[0].data);
    REQUIRE(names.data[0] == "Alice");
    REQUIRE(table.num_rows() == 1);
}

TEST_CASE("CSV rejects ragged rows", "[csv]") {
    std::istringstream input("a,b\n1,2\n3\n");
    REQUIRE_THROWS_AS(load_csv(input), std::runtime_error);
}

TEST_CASE("CSV missing file", "[csv]") {
    REQUIRE_THROWS_AS(load_csv("does_not_exist.csv"), std::runtime_error);
}
