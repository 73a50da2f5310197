#include "exec/key_extractor.hpp"
#include "exec/errors.h"
#include "exec/row_encoding.hpp"
#include <fmt/core.h>

namespace eqjoin {

KeyExtractor::KeyExtractor(const ExprList& key_exprs,
                           std::vector<std::string> input_names,
                           std::vector<TypeId> input_types,
                           RowEncoding encoding)
    : keys_(clone_all(key_exprs)),
      input_names_(std::move(input_names)),
      input_types_(std::move(input_types)),
      encoding_(encoding) {
    if (input_names_.size() != input_types_.size()) {
        throw ConfigurationError("Input schema names and types differ in length");
    }
    bindings_ = make_bindings(input_names_, input_types_);
    key_types_.reserve(keys_.size());
    for (const auto& key : keys_) {
        key_types_.push_back(infer_type(key.get(), bindings_));
    }
    if (encoding_ == RowEncoding::PACKED) {
        for (size_t i = 0; i < key_types_.size(); ++i) {
            if (!packed_supports(key_types_[i])) {
                throw ConfigurationError(fmt::format("Join key {} has type {}, which packed rows cannot hold",
                                                     keys_[i]->to_string(), type_name(key_types_[i])));
            }
        }
        writer_.emplace(key_types_);
    }
}

KeyTuple KeyExtractor::operator()(const Row& row) const {
    std::vector<Datum> values;
    values.reserve(keys_.size());
    for (const auto& key : keys_) {
        values.push_back(evaluate_expr(key.get(), row, bindings_));
    }
    if (writer_) {
        return Row(writer_->encode(values));
    }
    return Row::of(std::move(values));
}

std::unique_ptr<KeyExtractor> make_extractor(const ExprList& key_exprs,
                                             const std::vector<std::string>& input_names,
                                             const std::vector<TypeId>& input_types,
                                             RowEncoding encoding) {
    return std::make_unique<KeyExtractor>(key_exprs, input_names, input_types, encoding);
}

} // namespace eqjoin
