#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "types.h"
#include "exec/expression.h"
#include "exec/row.hpp"

namespace eqjoin {

// Maps an input row to its join key in a fixed encoding.
//
// The extractor owns copies of the key expressions and of the input schema,
// so it stays valid after the plan that built it is gone. It is pinned in
// memory because its bindings point into its own members.
class KeyExtractor {
public:
    KeyExtractor(const ExprList& key_exprs,
                 std::vector<std::string> input_names,
                 std::vector<TypeId> input_types,
                 RowEncoding encoding);

    KeyExtractor(const KeyExtractor&) = delete;
    KeyExtractor& operator=(const KeyExtractor&) = delete;

    // Pure; `row` is left untouched. Use any_null() on the result to test
    // for null key fields.
    KeyTuple operator()(const Row& row) const;

    RowEncoding encoding() const { return encoding_; }
    const std::vector<TypeId>& key_types() const { return key_types_; }
    const std::vector<TypeId>& input_types() const { return input_types_; }
    size_t num_keys() const { return keys_.size(); }

private:
    ExprList keys_;
    std::vector<std::string> input_names_;
    std::vector<TypeId> input_types_;
    ExprBindings bindings_;
    std::vector<TypeId> key_types_;
    RowEncoding encoding_;
    std::optional<PackedRowWriter> writer_;
};

// Throws ConfigurationError when a key column is unknown or when `encoding`
// is PACKED and a key type cannot be packed.
std::unique_ptr<KeyExtractor> make_extractor(const ExprList& key_exprs,
                                             const std::vector<std::string>& input_names,
                                             const std::vector<TypeId>& input_types,
                                             RowEncoding encoding);

} // namespace eqjoin
