#include "exec/hashed_relation.hpp"
#include "exec/errors.h"
#include "exec/row_encoding.hpp"
#include <exception>
#include <new>
#include <fmt/core.h>

namespace eqjoin {

HashedRelation HashedRelation::build(Operator& input, const KeyExtractor& key_of) {
    if (input.output_types() != key_of.input_types()) {
        throw ConfigurationError("Build input schema does not match its key extractor");
    }
    HashedRelation relation(key_of.encoding(), key_of.key_types());
    RowConverter converter(input.output_types(), key_of.encoding());

    input.open();
    try {
        Row row;
        while (input.next(row)) {
            Row stored = converter.convert(std::move(row));
            KeyTuple key = key_of(stored);
            relation.table_[std::move(key)].push_back(std::move(stored));
            ++relation.num_rows_;
        }
    } catch (const std::bad_alloc&) {
        size_t materialized = relation.num_rows_;
        relation.table_.clear();
        input.close();
        throw ResourceExhaustedError(fmt::format(
            "Out of memory building hash relation after {} rows", materialized));
    } catch (const std::exception&) {
        input.close();
        throw;
    }
    input.close();
    return relation;
}

const HashedRelation::Bucket* HashedRelation::get(const KeyTuple& key) const {
    auto it = table_.find(key);
    if (it == table_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace eqjoin
