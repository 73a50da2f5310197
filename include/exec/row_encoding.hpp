#pragma once

#include <optional>
#include <vector>
#include "types.h"
#include "exec/row.hpp"

namespace eqjoin {

// True if the packed encoding can hold values of this type.
bool packed_supports(TypeId type);
bool packed_supports(const std::vector<TypeId>& types);

// PACKED iff codegen is enabled and every key and output type is packable.
RowEncoding select_encoding(const std::vector<TypeId>& key_types,
                            const std::vector<TypeId>& output_types,
                            bool codegen_enabled);

// Re-encodes rows of one input schema into a fixed encoding.
class RowConverter {
public:
    RowConverter(std::vector<TypeId> types, RowEncoding encoding);

    RowEncoding encoding() const { return encoding_; }

    // Returns `row` unchanged when it already has the target encoding.
    Row convert(Row row) const;

private:
    std::vector<TypeId> types_;
    RowEncoding encoding_;
    std::optional<PackedRowWriter> writer_;
};

} // namespace eqjoin
