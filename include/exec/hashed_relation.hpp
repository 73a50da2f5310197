#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>
#include "exec/key_extractor.hpp"
#include "exec/operator.hpp"
#include "exec/row.hpp"

namespace eqjoin {

// Build-side multimap from join key to the rows sharing it, in input order.
// Read-only once built. Rows are stored in the key extractor's encoding.
class HashedRelation {
public:
    using Bucket = std::vector<Row>;

    // Drains `input` (open, next until exhausted, close). Rows whose key has a
    // null field are stored like any other; probes never ask for them.
    // Throws ResourceExhaustedError if the rows do not fit in memory.
    static HashedRelation build(Operator& input, const KeyExtractor& key_of);

    // Bucket for `key`, or nullptr when no build row has that key.
    const Bucket* get(const KeyTuple& key) const;

    RowEncoding encoding() const { return encoding_; }
    const std::vector<TypeId>& key_types() const { return key_types_; }
    size_t num_keys() const { return table_.size(); }
    size_t num_rows() const { return num_rows_; }
    // True when every key maps to exactly one row.
    bool key_is_unique() const { return num_rows_ == table_.size(); }

private:
    HashedRelation(RowEncoding encoding, std::vector<TypeId> key_types)
        : encoding_(encoding), key_types_(std::move(key_types)) {}

    RowEncoding encoding_;
    std::vector<TypeId> key_types_;
    std::unordered_map<KeyTuple, Bucket, RowHash, RowEqual> table_;
    size_t num_rows_ = 0;
};

} // namespace eqjoin
