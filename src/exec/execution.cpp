#include "exec/operator.hpp"
#include <vector>
#include <string>
#include <fmt/core.h>

namespace eqjoin {

std::string render_datum(const Datum& value, const Dictionary* dict) {
    if (value.is_null()) {
        return "NULL";
    }
    switch (value.type) {
        case TypeId::INT64:
            return std::to_string(value.value.i64_val);
        case TypeId::DOUBLE:
            return fmt::format("{}", value.value.f64_val);
        case TypeId::STRING:
            if (dict) {
                return dict->get(value.value.str_id);
            }
            return std::to_string(value.value.str_id); // fallback to code
        case TypeId::DATE32:
            // For now, print as int
            return std::to_string(value.value.date32_val);
        case TypeId::TEXT:
            return value.text;
    }
    return "?";
}

size_t run_query(Operator& root,
                 Formatter& formatter,
                 const Dictionary* dict) {
    formatter.begin(root.output_names(), root.output_types());
    root.open();
    Row row;
    std::size_t row_count = 0;
    while (root.next(row)) {
        std::vector<std::string> cells;
        cells.reserve(row.num_fields());
        for (size_t j = 0; j < row.num_fields(); ++j) {
            cells.push_back(render_datum(row.get(j), dict));
        }
        formatter.write_row(std::move(cells));
        ++row_count;
    }
    root.close();
    formatter.end(row_count);
    return row_count;
}

} // namespace eqjoin
