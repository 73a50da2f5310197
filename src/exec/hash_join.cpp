#include "exec/hash_join.hpp"
#include "exec/errors.h"
#include "exec/row_encoding.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/core.h>

namespace eqjoin {

namespace {

std::vector<TypeId> key_types_of(const ExprList& keys,
                                 const std::vector<std::string>& names,
                                 const std::vector<TypeId>& types) {
    ExprBindings bindings = make_bindings(names, types);
    std::vector<TypeId> key_types;
    key_types.reserve(keys.size());
    for (const auto& key : keys) {
        key_types.push_back(infer_type(key.get(), bindings));
    }
    return key_types;
}

}

const char* to_string(BuildSide side) {
    switch (side) {
        case BuildSide::LEFT: return "left";
        case BuildSide::RIGHT: return "right";
    }
    return "unknown";
}

BuildSide parse_build_side(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "left") return BuildSide::LEFT;
    if (lowered == "right") return BuildSide::RIGHT;
    throw ConfigurationError(fmt::format("Unknown build side '{}'. Use 'left' or 'right'.", text));
}

JoinSides resolve_join_sides(BuildSide side,
                             Operator& left,
                             Operator& right,
                             const ExprList& left_keys,
                             const ExprList& right_keys) {
    switch (side) {
        case BuildSide::LEFT:
            return {&left, &right, &left_keys, &right_keys};
        case BuildSide::RIGHT:
            return {&right, &left, &right_keys, &left_keys};
    }
    throw ConfigurationError("Unknown build side");
}

HashJoinIterator::HashJoinIterator(Operator& stream,
                                   std::shared_ptr<const HashedRelation> relation,
                                   const KeyExtractor& stream_keys,
                                   BuildSide build_side,
                                   std::vector<TypeId> output_types)
    : stream_(stream),
      relation_(std::move(relation)),
      stream_keys_(stream_keys),
      stream_converter_(stream.output_types(), stream_keys.encoding()),
      build_side_(build_side) {
    if (!relation_) {
        throw std::invalid_argument("Hash join iterator needs a built relation");
    }
    if (stream_keys_.encoding() != relation_->encoding()) {
        throw ConfigurationError(fmt::format("Stream keys are {} but the relation is {}",
                                             to_string(stream_keys_.encoding()), to_string(relation_->encoding())));
    }
    if (stream_keys_.key_types() != relation_->key_types()) {
        throw ConfigurationError("Stream and build key types differ");
    }
    if (relation_->encoding() == RowEncoding::PACKED) {
        writer_.emplace(std::move(output_types));
        output_ = Row(PackedRow{});
    } else {
        output_ = Row(GenericRow{});
    }
}

bool HashJoinIterator::has_next() {
    switch (state_) {
        case State::EMITTING:
            return true;
        case State::EXHAUSTED:
            return false;
        case State::SEEKING:
            return fetch_next();
    }
    return false;
}

/**
 * Pulls stream rows until one has a non-null key with at least one build
 * match. Returns false once the stream input runs out.
 */
bool HashJoinIterator::fetch_next() {
    current_matches_ = nullptr;
    match_position_ = 0;

    Row row;
    while (stream_.next(row)) {
        current_stream_row_ = stream_converter_.convert(std::move(row));
        KeyTuple key = stream_keys_(current_stream_row_);
        if (key.any_null()) {
            continue;
        }
        const HashedRelation::Bucket* bucket = relation_->get(key);
        if (bucket == nullptr || bucket->empty()) {
            continue;
        }
        current_matches_ = bucket;
        state_ = State::EMITTING;
        return true;
    }
    state_ = State::EXHAUSTED;
    return false;
}

const Row& HashJoinIterator::next() {
    if (!has_next()) {
        throw std::logic_error("next() called on an exhausted hash join iterator");
    }
    const Row& build_row = (*current_matches_)[match_position_];
    const Row& left = build_side_ == BuildSide::RIGHT ? current_stream_row_ : build_row;
    const Row& right = build_side_ == BuildSide::RIGHT ? build_row : current_stream_row_;

    if (writer_) {
        writer_->encode_joined(left, right, *output_.packed());
    } else {
        auto& values = output_.generic()->values;
        values.clear();
        for (size_t i = 0; i < left.num_fields(); ++i) {
            values.push_back(left.get(i));
        }
        for (size_t i = 0; i < right.num_fields(); ++i) {
            values.push_back(right.get(i));
        }
    }

    ++match_position_;
    if (match_position_ >= current_matches_->size()) {
        current_matches_ = nullptr;
        match_position_ = 0;
        state_ = State::SEEKING;
    }
    return output_;
}

HashJoin::HashJoin(std::unique_ptr<Operator> left,
                   std::unique_ptr<Operator> right,
                   ExprList left_keys,
                   ExprList right_keys,
                   JoinConfig config)
    : left_child(std::move(left)),
      right_child(std::move(right)),
      left_key_exprs(std::move(left_keys)),
      right_key_exprs(std::move(right_keys)),
      join_config(config),
      join_sides{} {
    if (!left_child || !right_child) {
        throw ConfigurationError("Join operands cannot be null");
    }
    if (left_key_exprs.empty()) {
        throw ConfigurationError("Equi-join needs at least one key");
    }
    if (left_key_exprs.size() != right_key_exprs.size()) {
        throw ConfigurationError(fmt::format("Join key cardinality mismatch: {} left, {} right",
                                             left_key_exprs.size(), right_key_exprs.size()));
    }

    const auto& left_names = left_child->output_names();
    const auto& left_types = left_child->output_types();
    const auto& right_names = right_child->output_names();
    const auto& right_types = right_child->output_types();

    names_ = left_names;
    names_.insert(names_.end(), right_names.begin(), right_names.end());
    types_ = left_types;
    types_.insert(types_.end(), right_types.begin(), right_types.end());

    auto left_key_types = key_types_of(left_key_exprs, left_names, left_types);
    auto right_key_types = key_types_of(right_key_exprs, right_names, right_types);
    for (size_t i = 0; i < left_key_types.size(); ++i) {
        if (left_key_types[i] != right_key_types[i]) {
            throw ConfigurationError(fmt::format("Join key type mismatch: {} is {}, {} is {}",
                                                 left_key_exprs[i]->to_string(), type_name(left_key_types[i]),
                                                 right_key_exprs[i]->to_string(), type_name(right_key_types[i])));
        }
    }

    Dictionary* left_dict = left_child->dictionary();
    Dictionary* right_dict = right_child->dictionary();
    bool string_keys = std::any_of(left_key_types.begin(), left_key_types.end(), [](TypeId t) { return t == TypeId::STRING; });
    if (string_keys && left_dict && right_dict && left_dict != right_dict) {
        throw ConfigurationError("STRING join keys must share one dictionary");
    }
    bool left_has_string = std::any_of(left_types.begin(), left_types.end(), [](TypeId t) { return t == TypeId::STRING; });
    bool right_has_string = std::any_of(right_types.begin(), right_types.end(), [](TypeId t) { return t == TypeId::STRING; });
    if (left_has_string && left_dict) {
        dict_ = left_dict;
    } else if (right_has_string && right_dict) {
        dict_ = right_dict;
    } else {
        dict_ = left_dict ? left_dict : right_dict;
    }

    join_sides = resolve_join_sides(join_config.build_side, *left_child, *right_child,
                                    left_key_exprs, right_key_exprs);
    build_key_types = join_config.build_side == BuildSide::LEFT ? left_key_types : right_key_types;
}

RowEncoding HashJoin::encoding() const {
    if (!encoding_) {
        encoding_ = select_encoding(build_key_types, types_, join_config.codegen_enabled);
    }
    return *encoding_;
}

std::string HashJoin::explain() const {
    return fmt::format("HashJoin(build={}, encoding={}, left_keys={}, right_keys={})",
                       to_string(join_config.build_side), to_string(encoding()),
                       join_to_string(left_key_exprs), join_to_string(right_key_exprs));
}

void HashJoin::open() {
    iterator_.reset();
    relation_.reset();

    Operator& build = *join_sides.build_plan;
    Operator& stream = *join_sides.stream_plan;
    build_key_of = make_extractor(*join_sides.build_keys, build.output_names(), build.output_types(), encoding());
    stream_key_of = make_extractor(*join_sides.stream_keys, stream.output_names(), stream.output_types(), encoding());

    relation_ = std::make_shared<const HashedRelation>(HashedRelation::build(build, *build_key_of));
    stats_ = {relation_->num_keys(), relation_->num_rows(), relation_->key_is_unique()};

    stream.open();
    iterator_ = std::make_unique<HashJoinIterator>(stream, relation_, *stream_key_of,
                                                   join_config.build_side, types_);
}

bool HashJoin::next(Row& out) {
    if (!iterator_) {
        throw std::logic_error("HashJoin::next() called before open()");
    }
    if (!iterator_->has_next()) {
        return false;
    }
    out = iterator_->next();
    return true;
}

void HashJoin::close() {
    if (iterator_) {
        join_sides.stream_plan->close();
    }
    iterator_.reset();
    relation_.reset();
}

} // namespace eqjoin
