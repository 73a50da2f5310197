#include <catch2/catch.hpp>
#include "exec/errors.h"
#include "exec/hash_join.hpp"
#include "test_helpers.h"

using namespace eqjoin;
using namespace eqjoin::testing;

namespace {

ExprList key_k(const std::string& prefix) {
    ExprList keys;
    keys.push_back(col(prefix + ".k"));
    return keys;
}

std::vector<TypeId> concat(const std::vector<TypeId>& a, const std::vector<TypeId>& b) {
    std::vector<TypeId> out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

// Builds `build` and probes it with `stream`; both must outlive the fixture.
struct Probe {
    Probe(Operator& stream, Operator& build, BuildSide side, RowEncoding encoding,
          const std::string& stream_prefix, const std::string& build_prefix)
        : build_keys(make_extractor(key_k(build_prefix), build.output_names(), build.output_types(), encoding)),
          stream_keys(make_extractor(key_k(stream_prefix), stream.output_names(), stream.output_types(), encoding)),
          relation(std::make_shared<const HashedRelation>(HashedRelation::build(build, *build_keys))) {
        stream.open();
        auto output = side == BuildSide::RIGHT ? concat(stream.output_types(), build.output_types())
                                               : concat(build.output_types(), stream.output_types());
        iterator = std::make_unique<HashJoinIterator>(stream, relation, *stream_keys, side, output);
    }

    std::vector<std::vector<std::string>> drain_all() {
        std::vector<std::vector<std::string>> out;
        while (iterator->has_next()) {
            out.push_back(render(iterator->next()));
        }
        return out;
    }

    std::unique_ptr<KeyExtractor> build_keys;
    std::unique_ptr<KeyExtractor> stream_keys;
    std::shared_ptr<const HashedRelation> relation;
    std::unique_ptr<HashJoinIterator> iterator;
};

using Rows = std::vector<std::vector<std::string>>;

}

TEST_CASE("Probe fans out over duplicate build keys", "[join]") {
    auto stream = kv_scan("l", {{1, "x"}});
    auto build = kv_scan("r", {{1, "a"}, {1, "b"}, {2, "c"}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");

    REQUIRE(probe.drain_all() == Rows{{"1", "x", "1", "a"}, {"1", "x", "1", "b"}});
}

TEST_CASE("Duplicate stream keys each meet the build match", "[join]") {
    auto stream = kv_scan("l", {{1, "a"}, {1, "b"}, {2, "c"}});
    auto build = kv_scan("r", {{1, "x"}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");

    REQUIRE(probe.drain_all() == Rows{{"1", "a", "1", "x"}, {"1", "b", "1", "x"}});
}

TEST_CASE("Build matches come out in build input order", "[join]") {
    auto stream = kv_int_scan("l", {{1, 100}, {3, 300}});
    auto build = kv_int_scan("r", {{1, 10}, {1, 11}, {2, 20}, {1, 12}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::PACKED, "l", "r");

    REQUIRE(probe.drain_all() == Rows{{"1", "100", "1", "10"}, {"1", "100", "1", "11"}, {"1", "100", "1", "12"}});
}

TEST_CASE("Left build keeps left columns first", "[join]") {
    auto build = kv_int_scan("l", {{1, 10}});
    auto stream = kv_int_scan("r", {{1, 100}, {1, 101}});
    Probe probe(*stream, *build, BuildSide::LEFT, RowEncoding::PACKED, "r", "l");

    REQUIRE(probe.drain_all() == Rows{{"1", "10", "1", "100"}, {"1", "10", "1", "101"}});
}

TEST_CASE("has_next is idempotent", "[join]") {
    auto stream = kv_scan("l", {{1, "a"}, {2, "b"}});
    auto build = kv_scan("r", {{1, "x"}, {2, "y"}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");
    auto& it = *probe.iterator;

    REQUIRE(it.has_next());
    REQUIRE(it.has_next());
    REQUIRE(render(it.next()) == std::vector<std::string>{"1", "a", "1", "x"});
    REQUIRE(it.has_next());
    REQUIRE(it.has_next());
    REQUIRE(render(it.next()) == std::vector<std::string>{"2", "b", "2", "y"});
    REQUIRE_FALSE(it.has_next());
    REQUIRE_FALSE(it.has_next());
}

TEST_CASE("Iterator state transitions", "[join]") {
    auto stream = kv_scan("l", {{1, "a"}});
    auto build = kv_scan("r", {{1, "x"}, {1, "y"}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");
    auto& it = *probe.iterator;
    using State = HashJoinIterator::State;

    REQUIRE(it.state() == State::SEEKING);
    REQUIRE(it.has_next());
    REQUIRE(it.state() == State::EMITTING);
    it.next();
    REQUIRE(it.state() == State::EMITTING);
    it.next();
    REQUIRE(it.state() == State::SEEKING);
    REQUIRE_FALSE(it.has_next());
    REQUIRE(it.state() == State::EXHAUSTED);
}

TEST_CASE("Null keys never match", "[join]") {
    std::vector<Row> left_rows{row_of({dnull(), dt("a")}), row_of({di(1), dt("b")})};
    std::vector<Row> right_rows{row_of({dnull(), dt("x")}), row_of({di(1), dt("y")})};
    RowsScan stream({"l.k", "l.v"}, {TypeId::INT64, TypeId::TEXT}, std::move(left_rows));
    RowsScan build({"r.k", "r.v"}, {TypeId::INT64, TypeId::TEXT}, std::move(right_rows));
    Probe probe(stream, build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");

    REQUIRE(probe.drain_all() == Rows{{"1", "b", "1", "y"}});
}

TEST_CASE("Null keys never match in packed rows", "[join]") {
    std::vector<Row> left_rows{row_of({dnull(), di(10)}), row_of({di(1), di(11)})};
    std::vector<Row> right_rows{row_of({dnull(), di(20)}), row_of({di(1), di(21)})};
    RowsScan stream({"l.k", "l.v"}, {TypeId::INT64, TypeId::INT64}, std::move(left_rows));
    RowsScan build({"r.k", "r.v"}, {TypeId::INT64, TypeId::INT64}, std::move(right_rows));
    Probe probe(stream, build, BuildSide::RIGHT, RowEncoding::PACKED, "l", "r");

    REQUIRE(probe.relation->num_rows() == 2);
    REQUIRE(probe.drain_all() == Rows{{"1", "11", "1", "21"}});
}

TEST_CASE("Empty inputs produce nothing", "[join]") {
    SECTION("empty build") {
        auto stream = kv_scan("l", {{1, "a"}});
        auto build = kv_scan("r", {});
        Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");
        REQUIRE_FALSE(probe.iterator->has_next());
    }

    SECTION("empty stream") {
        auto stream = kv_scan("l", {});
        auto build = kv_scan("r", {{1, "x"}});
        Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");
        REQUIRE_FALSE(probe.iterator->has_next());
        REQUIRE(probe.iterator->state() == HashJoinIterator::State::EXHAUSTED);
    }
}

TEST_CASE("next past the end throws", "[join]") {
    auto stream = kv_scan("l", {{1, "a"}});
    auto build = kv_scan("r", {{2, "x"}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::GENERIC, "l", "r");

    REQUIRE_THROWS_AS(probe.iterator->next(), std::logic_error);
}

TEST_CASE("Output row is overwritten by the next call", "[join]") {
    auto stream = kv_int_scan("l", {{1, 100}, {2, 200}});
    auto build = kv_int_scan("r", {{1, 10}, {2, 20}});
    Probe probe(*stream, *build, BuildSide::RIGHT, RowEncoding::PACKED, "l", "r");

    REQUIRE(probe.iterator->has_next());
    const Row& first = probe.iterator->next();
    Row copy = first;
    REQUIRE(first.encoding() == RowEncoding::PACKED);

    REQUIRE(probe.iterator->has_next());
    const Row& second = probe.iterator->next();
    REQUIRE(&first == &second);
    REQUIRE(render(copy) == std::vector<std::string>{"1", "100", "1", "10"});
    REQUIRE(render(second) == std::vector<std::string>{"2", "200", "2", "20"});
}

TEST_CASE("Stream keys must match the relation", "[join]") {
    auto stream = kv_int_scan("l", {{1, 100}});
    auto build = kv_int_scan("r", {{1, 10}});
    auto build_keys = make_extractor(key_k("r"), build->output_names(), build->output_types(), RowEncoding::PACKED);
    auto stream_keys = make_extractor(key_k("l"), stream->output_names(), stream->output_types(), RowEncoding::GENERIC);
    auto relation = std::make_shared<const HashedRelation>(HashedRelation::build(*build, *build_keys));

    auto types = concat(stream->output_types(), build->output_types());
    REQUIRE_THROWS_AS(HashJoinIterator(*stream, relation, *stream_keys, BuildSide::RIGHT, types), ConfigurationError);
}

TEST_CASE("Build side parsing and resolution", "[join]") {
    REQUIRE(parse_build_side("left") == BuildSide::LEFT);
    REQUIRE(parse_build_side("RIGHT") == BuildSide::RIGHT);
    REQUIRE_THROWS_AS(parse_build_side("middle"), ConfigurationError);
    REQUIRE(std::string(to_string(BuildSide::LEFT)) == "left");

    auto left = kv_scan("l", {});
    auto right = kv_scan("r", {});
    ExprList left_keys = key_k("l");
    ExprList right_keys = key_k("r");

    JoinSides sides = resolve_join_sides(BuildSide::RIGHT, *left, *right, left_keys, right_keys);
    REQUIRE(sides.build_plan == right.get());
    REQUIRE(sides.stream_plan == left.get());
    REQUIRE(sides.build_keys == &right_keys);

    sides = resolve_join_sides(BuildSide::LEFT, *left, *right, left_keys, right_keys);
    REQUIRE(sides.build_plan == left.get());
    REQUIRE(sides.stream_keys == &right_keys);
}
