#include "exec/row_encoding.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace eqjoin {

bool packed_supports(TypeId type) {
    switch (type) {
        case TypeId::INT64:
        case TypeId::DOUBLE:
        case TypeId::STRING:
        case TypeId::DATE32:
            return true;
        case TypeId::TEXT:
            return false;
    }
    return false;
}

bool packed_supports(const std::vector<TypeId>& types) {
    return std::all_of(types.begin(), types.end(), [](TypeId t) { return packed_supports(t); });
}

RowEncoding select_encoding(const std::vector<TypeId>& key_types,
                            const std::vector<TypeId>& output_types,
                            bool codegen_enabled) {
    if (codegen_enabled && packed_supports(key_types) && packed_supports(output_types)) {
        return RowEncoding::PACKED;
    }
    return RowEncoding::GENERIC;
}

RowConverter::RowConverter(std::vector<TypeId> types, RowEncoding encoding)
    : types_(std::move(types)), encoding_(encoding) {
    if (encoding_ == RowEncoding::PACKED) {
        writer_.emplace(types_);
    }
}

Row RowConverter::convert(Row row) const {
    if (row.num_fields() != types_.size()) {
        throw std::runtime_error(fmt::format("Row has {} fields, schema has {}", row.num_fields(), types_.size()));
    }
    if (row.encoding() == encoding_) {
        return row;
    }
    if (encoding_ == RowEncoding::PACKED) {
        PackedRow packed;
        writer_->encode(row, packed);
        return Row(std::move(packed));
    }
    GenericRow generic;
    generic.values.reserve(row.num_fields());
    for (size_t i = 0; i < row.num_fields(); ++i) {
        generic.values.push_back(row.get(i));
    }
    return Row(std::move(generic));
}

} // namespace eqjoin
