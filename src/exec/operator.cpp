#include "exec/operator.hpp"
#include <stdexcept>
#include <fmt/core.h>

namespace eqjoin {

namespace {

template<typename T>
const ColumnVector<T>& typed(const Column& column) {
    const auto* vec = dynamic_cast<const ColumnVector<T>*>(&column);
    if (!vec) {
        throw std::runtime_error("Column storage does not match its type");
    }
    return *vec;
}

Datum extract_value(const Column& column, size_t row) {
    TypeId type = column.type();
    if (column.is_null(row)) {
        return Datum::null_of(type);
    }
    switch (type) {
        case TypeId::INT64:
            return Datum::from_i64(typed<int64_t>(column).data[row]);
        case TypeId::DOUBLE:
            return Datum::from_f64(typed<double>(column).data[row]);
        case TypeId::STRING:
            return Datum::from_str(typed<uint32_t>(column).data[row]);
        case TypeId::DATE32:
            return Datum::from_date32(typed<int32_t>(column).data[row]);
        case TypeId::TEXT:
            return Datum::from_text(typed<std::string>(column).data[row]);
    }
    throw std::runtime_error("Unknown column type");
}

}

TableScan::TableScan(const Table* t, std::vector<size_t> idx)
    : table(t), indices(std::move(idx)) {
    if (!table) {
        throw std::runtime_error("Scan table is null");
    }
    if (indices.empty()) {
        indices.reserve(table->columns.size());
        for (size_t i = 0; i < table->columns.size(); ++i) {
            indices.push_back(i);
        }
    }
    names_.reserve(indices.size());
    types_.reserve(indices.size());
    for (size_t i : indices) {
        if (i >= table->columns.size()) {
            throw std::runtime_error(fmt::format("Scan column {} out of range", i));
        }
        names_.push_back(table->columns[i].name);
        types_.push_back(table->columns[i].data->type());
    }
    dict_ = table->dict.get();
}

void TableScan::open() {
    offset = 0;
}

bool TableScan::next(Row& out) {
    if (indices.empty() || offset >= table->num_rows()) return false;

    GenericRow row;
    row.values.reserve(indices.size());
    for (size_t idx : indices) {
        row.values.push_back(extract_value(*table->columns[idx].data, offset));
    }
    out = Row(std::move(row));
    ++offset;
    return true;
}

void TableScan::close() {}

RowsScan::RowsScan(std::vector<std::string> names,
                   std::vector<TypeId> types,
                   std::vector<Row> input,
                   Dictionary* dict)
    : rows(std::move(input)) {
    if (names.size() != types.size()) {
        throw std::runtime_error("RowsScan names and types differ in length");
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].num_fields() != types.size()) {
            throw std::runtime_error(fmt::format("RowsScan row {} has {} fields, expected {}",
                                                 i, rows[i].num_fields(), types.size()));
        }
    }
    names_ = std::move(names);
    types_ = std::move(types);
    dict_ = dict;
}

void RowsScan::open() {
    offset = 0;
}

bool RowsScan::next(Row& out) {
    if (offset >= rows.size()) return false;
    out = rows[offset++];
    return true;
}

void RowsScan::close() {}

}
