#include "exec/formatter.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <fmt/core.h>

namespace eqjoin {

MarkdownFormatter::MarkdownFormatter(std::ostream& stream) : Formatter(stream) {}

void MarkdownFormatter::begin(const std::vector<std::string>& names, const std::vector<TypeId>& types) {
    headers = names;
    data.clear();
    right_align.assign(headers.size(), false);
    for (std::size_t i = 0; i < types.size() && i < right_align.size(); ++i) {
        right_align[i] = types[i] == TypeId::INT64 || types[i] == TypeId::DOUBLE;
    }
    widths.assign(headers.size(), 0);
    for (std::size_t i = 0; i < headers.size(); ++i) {
        widths[i] = std::max<std::size_t>(headers[i].size(), widths[i]);
    }
}

void MarkdownFormatter::write_row(std::vector<std::string> row) {
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i >= widths.size()) {
            widths.resize(i + 1, 0);
        }
        widths[i] = std::max<std::size_t>(widths[i], row[i].size());
    }
    data.push_back(std::move(row));
}

void MarkdownFormatter::end(std::size_t row_count) {
    if (row_count == 0) {
        out << "(no results)\n";
        return;
    }
    if (headers.size() < widths.size()) {
        for (std::size_t i = headers.size(); i < widths.size(); ++i) {
            headers.push_back(fmt::format("col{}", i + 1));
            widths[i] = std::max<std::size_t>(widths[i], headers[i].size());
        }
    }
    right_align.resize(widths.size(), false);
    auto flags = out.flags();
    auto print_row = [&](const std::vector<std::string>& cells, bool is_header) {
        out << "|";
        for (std::size_t i = 0; i < widths.size(); ++i) {
            bool right = right_align[i] && !is_header;
            out << " " << (right ? std::right : std::left) << std::setw(static_cast<int>(widths[i]))
                << (i < cells.size() ? cells[i] : std::string()) << " |";
        }
        out << '\n';
    };

    print_row(headers, true);
    out << "|";
    for (std::size_t i = 0; i < widths.size(); ++i) {
        std::string rule(widths[i], '-');
        if (right_align[i] && !rule.empty()) {
            rule.back() = ':';
        }
        out << " " << rule << " |";
    }
    out << '\n';
    for (const auto& row : data) {
        print_row(row, false);
    }
    out.flags(flags);
}

CsvFormatter::CsvFormatter(std::ostream& stream, char delimiter) : Formatter(stream), sep(delimiter) {}

void CsvFormatter::begin(const std::vector<std::string>& names, const std::vector<TypeId>& types) {
    (void)types;
    if (names.empty()) {
        return;
    }
    bool first = true;
    for (const auto& name : names) {
        if (!first) {
            out << sep;
        }
        out << escape_cell(name);
        first = false;
    }
    out << '\n';
}

void CsvFormatter::write_row(std::vector<std::string> row) {
    bool first = true;
    for (const auto& cell : row) {
        if (!first) {
            out << sep;
        }
        out << escape_cell(cell);
        first = false;
    }
    out << '\n';
}

void CsvFormatter::end(std::size_t row_count) {
    (void)row_count;
}

std::string CsvFormatter::escape_cell(const std::string& cell) const {
    bool needs_quotes = cell.find(sep) != std::string::npos ||
                        cell.find('"') != std::string::npos ||
                        cell.find('\n') != std::string::npos ||
                        cell.find('\r') != std::string::npos;
    if (!needs_quotes) {
        return cell;
    }
    std::string escaped;
    escaped.reserve(cell.size() + 2);
    escaped.push_back('"');
    for (char ch : cell) {
        if (ch == '"') {
            escaped.push_back('"');
        }
        escaped.push_back(ch);
    }
    escaped.push_back('"');
    return escaped;
}

} // namespace eqjoin
