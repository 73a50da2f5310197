#include <catch2/catch.hpp>
#include <string>
#include "types.h"

TEST_CASE("Datum union test", "[types]") {
    // Test int64_t datum
    eqjoin::Datum d1 = eqjoin::Datum::from_i64(42);
    REQUIRE(d1.type == eqjoin::TypeId::INT64);
    REQUIRE(d1.as_i64() == 42);
    REQUIRE_FALSE(d1.is_null());

    // Test double datum
    eqjoin::Datum d2 = eqjoin::Datum::from_f64(3.14);
    REQUIRE(d2.type == eqjoin::TypeId::DOUBLE);
    REQUIRE(d2.as_f64() == 3.14);

    // Test string ID datum
    eqjoin::Datum d3 = eqjoin::Datum::from_str(123);
    REQUIRE(d3.type == eqjoin::TypeId::STRING);
    REQUIRE(d3.as_str() == 123);

    // Test date32 datum
    eqjoin::Datum d4 = eqjoin::Datum::from_date32(20231225);
    REQUIRE(d4.type == eqjoin::TypeId::DATE32);
    REQUIRE(d4.as_date32() == 20231225);

    // Test type mismatch error
    REQUIRE_THROWS_AS(d1.as_f64(), std::runtime_error);
}

TEST_CASE("Text and null datums", "[types]") {
    eqjoin::Datum text = eqjoin::Datum::from_text("north");
    REQUIRE(text.type == eqjoin::TypeId::TEXT);
    REQUIRE(text.as_text() == "north");
    REQUIRE_THROWS_AS(text.as_i64(), std::runtime_error);

    eqjoin::Datum null = eqjoin::Datum::null_of(eqjoin::TypeId::DATE32);
    REQUIRE(null.is_null());
    REQUIRE(null.type == eqjoin::TypeId::DATE32);
}

TEST_CASE("Type names", "[types]") {
    REQUIRE(std::string(eqjoin::type_name(eqjoin::TypeId::INT64)) == "INT64");
    REQUIRE(std::string(eqjoin::type_name(eqjoin::TypeId::TEXT)) == "TEXT");
}
