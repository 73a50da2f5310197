#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "types.h"
#include "exec/expression.h"
#include "exec/hashed_relation.hpp"
#include "exec/key_extractor.hpp"
#include "exec/operator.hpp"
#include "exec/row.hpp"
#include "exec/row_encoding.hpp"

namespace eqjoin {

// Which child is materialised into the hash table.
enum class BuildSide { LEFT, RIGHT };

const char* to_string(BuildSide side);
// Accepts "left" or "right" in any case; throws ConfigurationError otherwise.
BuildSide parse_build_side(std::string_view text);

struct JoinConfig {
    // Allows the packed row encoding when the key and output types permit it.
    bool codegen_enabled = true;
    BuildSide build_side = BuildSide::RIGHT;
};

// Build and stream roles of a join's children. Borrowed pointers.
struct JoinSides {
    Operator* build_plan;
    Operator* stream_plan;
    const ExprList* build_keys;
    const ExprList* stream_keys;
};

JoinSides resolve_join_sides(BuildSide side,
                             Operator& left,
                             Operator& right,
                             const ExprList& left_keys,
                             const ExprList& right_keys);

// Lazily probes a built relation with the rows of an already opened stream
// input, yielding one joined row per (stream row, matching build row) pair.
// Output columns are always the left child's followed by the right child's.
//
// The stream input and key extractor are borrowed and must outlive the
// iterator; the relation is shared read-only.
class HashJoinIterator {
public:
    enum class State { SEEKING, EMITTING, EXHAUSTED };

    HashJoinIterator(Operator& stream,
                     std::shared_ptr<const HashedRelation> relation,
                     const KeyExtractor& stream_keys,
                     BuildSide build_side,
                     std::vector<TypeId> output_types);

    // May pull stream rows to find the next match. Repeated calls without
    // next() do not advance.
    bool has_next();

    // The returned row is scratch storage owned by the iterator: it is
    // overwritten by the following call. Copy it to keep it.
    // Throws std::logic_error when has_next() is false.
    const Row& next();

    State state() const { return state_; }

private:
    bool fetch_next();

    Operator& stream_;
    std::shared_ptr<const HashedRelation> relation_;
    const KeyExtractor& stream_keys_;
    RowConverter stream_converter_;
    BuildSide build_side_;
    std::optional<PackedRowWriter> writer_;

    State state_ = State::SEEKING;
    Row current_stream_row_;
    const HashedRelation::Bucket* current_matches_ = nullptr;
    size_t match_position_ = 0;
    Row output_;
};

struct RelationStats {
    size_t num_keys = 0;
    size_t num_rows = 0;
    bool key_is_unique = true;
};

// Inner equi-join operator: builds a hash relation from one child on open()
// and streams the other through it.
struct HashJoin : public Operator {
    HashJoin(std::unique_ptr<Operator> left,
             std::unique_ptr<Operator> right,
             ExprList left_keys,
             ExprList right_keys,
             JoinConfig config = {});

    // join_sides points into this object's own children and key lists.
    HashJoin(const HashJoin&) = delete;
    HashJoin& operator=(const HashJoin&) = delete;

    void open() override;
    bool next(Row& out) override;
    void close() override;

    // Chosen on first use, then fixed for the operator's lifetime.
    RowEncoding encoding() const;
    const JoinSides& sides() const { return join_sides; }
    const JoinConfig& config() const { return join_config; }
    std::string explain() const;

    // Null before open() and after close().
    const HashedRelation* relation() const { return relation_.get(); }
    // Shape of the last relation built; survives close().
    const RelationStats& relation_stats() const { return stats_; }

private:
    std::unique_ptr<Operator> left_child;
    std::unique_ptr<Operator> right_child;
    ExprList left_key_exprs;
    ExprList right_key_exprs;
    JoinConfig join_config;
    JoinSides join_sides;
    std::vector<TypeId> build_key_types;

    mutable std::optional<RowEncoding> encoding_;
    std::unique_ptr<KeyExtractor> build_key_of;
    std::unique_ptr<KeyExtractor> stream_key_of;
    std::shared_ptr<const HashedRelation> relation_;
    std::unique_ptr<HashJoinIterator> iterator_;
    RelationStats stats_;
};

} // namespace eqjoin
