#include "storage/csv_loader.h"
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <fmt/core.h>

namespace eqjoin {

namespace {

std::vector<std::string> split_line(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        cells.push_back(token);
    }
    if (!line.empty() && line.back() == delimiter) {
        cells.emplace_back();
    }
    return cells;
}

bool parse_i64(const std::string& cell, i64& out) {
    const char* end = cell.data() + cell.size();
    auto [ptr, ec] = std::from_chars(cell.data(), end, out);
    return ec == std::errc() && ptr == end;
}

bool parse_f64(const std::string& cell, f64& out) {
    const char* end = cell.data() + cell.size();
    auto [ptr, ec] = std::from_chars(cell.data(), end, out);
    return ec == std::errc() && ptr == end;
}

bool parse_date(const std::string& cell, Date32& out) {
    if (cell.size() != 8) return false;
    i64 value = 0;
    if (!parse_i64(cell, value)) return false;
    if (value < 19000000 || value > 21000000) return false;
    out = static_cast<Date32>(value);
    return true;
}

template<typename T, typename Parse>
bool try_column(const std::vector<std::vector<std::string>>& rows,
                size_t col,
                Parse parse,
                std::unique_ptr<Column>& out) {
    auto column = std::make_unique<ColumnVector<T>>(rows.size());
    size_t non_empty = 0;
    for (const auto& row : rows) {
        const std::string& cell = row[col];
        if (cell.empty()) {
            column->append_null();
            continue;
        }
        T value{};
        if (!parse(cell, value)) return false;
        column->append(value);
        ++non_empty;
    }
    if (non_empty == 0) return false;
    out = std::move(column);
    return true;
}

}

Table load_csv(std::istream& input, const CsvOptions& options) {
    Table table;
    table.dict = options.dict ? options.dict : std::make_shared<Dictionary>();

    std::string line;
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;

    // Read headers
    if (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        headers = split_line(line, options.delimiter);
    }
    if (headers.empty()) {
        throw std::runtime_error("CSV input has no header");
    }

    // Read data rows
    size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto row = split_line(line, options.delimiter);
        if (row.size() != headers.size()) {
            throw std::runtime_error(fmt::format("Row size mismatch on line {}: expected {} cells, got {}",
                                                 line_no, headers.size(), row.size()));
        }
        rows.push_back(std::move(row));
    }

    for (size_t col = 0; col < headers.size(); ++col) {
        TableColumn column;
        column.name = headers[col];
        if (try_column<Date32>(rows, col, parse_date, column.data) ||
            try_column<i64>(rows, col, parse_i64, column.data) ||
            try_column<f64>(rows, col, parse_f64, column.data)) {
            table.columns.push_back(std::move(column));
            continue;
        }

        // Else, string
        if (options.dictionary_encode) {
            auto data = std::make_unique<ColumnVector<StrId>>(rows.size());
            for (const auto& row : rows) {
                if (row[col].empty()) {
                    data->append_null();
                } else {
                    data->append(table.dict->get_or_add(row[col]));
                }
            }
            column.data = std::move(data);
        } else {
            auto data = std::make_unique<ColumnVector<std::string>>(rows.size());
            for (const auto& row : rows) {
                if (row[col].empty()) {
                    data->append_null();
                } else {
                    data->append(row[col]);
                }
            }
            column.data = std::move(data);
        }
        table.columns.push_back(std::move(column));
    }
    return table;
}

Table load_csv(const std::string& filename, const CsvOptions& options) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    Table table = load_csv(file, options);
    table.name = filename;
    return table;
}

} // namespace eqjoin
