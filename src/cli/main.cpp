#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <fmt/core.h>
#include "exec/errors.h"
#include "exec/formatter.hpp"
#include "exec/hash_join.hpp"
#include "exec/operator.hpp"
#include "storage/csv_loader.h"
#include "util/console.h"

using namespace eqjoin::console;

namespace {

struct CliOptions {
    std::vector<std::string> files;
    std::vector<std::string> left_keys;
    std::vector<std::string> right_keys;
    eqjoin::JoinConfig join;
    bool inline_strings = false;
    bool explain = false;
    bool stats = false;
    std::string output_format = "markdown";
};

void print_usage() {
    fmt::print(stderr,
               "Usage: eqjoin LEFT.csv RIGHT.csv --left-key COL --right-key COL [...]\n"
               "  --left-key COL / --right-key COL  join key column, repeat for composite keys\n"
               "  --build-side left|right           side materialised into the hash table (default right)\n"
               "  --no-codegen                      force the generic row encoding\n"
               "  --inline-strings                  load strings as TEXT instead of dictionary ids\n"
               "  --output-format markdown|csv      result format (default markdown)\n"
               "  --explain                         print the join plan before running\n"
               "  --stats                           print build-side statistics after running\n");
}

std::string require_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw eqjoin::ConfigurationError(fmt::format("{} requires an argument", args[i]));
    }
    return args[++i];
}

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--left-key") {
            options.left_keys.push_back(require_value(args, i));
        } else if (arg == "--right-key") {
            options.right_keys.push_back(require_value(args, i));
        } else if (arg == "--build-side") {
            options.join.build_side = eqjoin::parse_build_side(require_value(args, i));
        } else if (arg == "--no-codegen") {
            options.join.codegen_enabled = false;
        } else if (arg == "--inline-strings") {
            options.inline_strings = true;
        } else if (arg == "--output-format") {
            options.output_format = require_value(args, i);
            std::transform(options.output_format.begin(), options.output_format.end(), options.output_format.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        } else if (arg == "--explain") {
            options.explain = true;
        } else if (arg == "--stats") {
            options.stats = true;
        } else if (arg.starts_with("--")) {
            throw eqjoin::ConfigurationError(fmt::format("Unknown option: {}", arg));
        } else {
            options.files.push_back(arg);
        }
    }
    if (options.files.size() != 2) {
        throw eqjoin::ConfigurationError(fmt::format("Expected two CSV files, got {}", options.files.size()));
    }
    if (options.left_keys.empty() || options.left_keys.size() != options.right_keys.size()) {
        throw eqjoin::ConfigurationError("Give the same number (at least one) of --left-key and --right-key");
    }
    if (options.output_format != "markdown" && options.output_format != "csv") {
        throw eqjoin::ConfigurationError(fmt::format("Unsupported output format '{}'. Use 'markdown' or 'csv'.", options.output_format));
    }
    return options;
}

eqjoin::ExprList key_columns(const std::vector<std::string>& names) {
    eqjoin::ExprList keys;
    keys.reserve(names.size());
    for (const auto& name : names) {
        keys.push_back(eqjoin::col(name));
    }
    return keys;
}

int run(const CliOptions& options) {
    eqjoin::CsvOptions csv;
    csv.dict = std::make_shared<eqjoin::Dictionary>();
    csv.dictionary_encode = !options.inline_strings;

    eqjoin::Table left_table = eqjoin::load_csv(options.files[0], csv);
    eqjoin::Table right_table = eqjoin::load_csv(options.files[1], csv);

    eqjoin::HashJoin join(std::make_unique<eqjoin::TableScan>(&left_table),
                          std::make_unique<eqjoin::TableScan>(&right_table),
                          key_columns(options.left_keys),
                          key_columns(options.right_keys),
                          options.join);
    if (options.explain) {
        print_info("{}", join.explain());
    }
    if (options.join.codegen_enabled && join.encoding() == eqjoin::RowEncoding::GENERIC) {
        print_warning("Packed rows unavailable for this schema, using generic rows");
    }

    size_t rows = 0;
    if (options.output_format == "csv") {
        eqjoin::CsvFormatter formatter(std::cout);
        rows = eqjoin::run_query(join, formatter, csv.dict.get());
    } else {
        eqjoin::MarkdownFormatter formatter(std::cout);
        rows = eqjoin::run_query(join, formatter, csv.dict.get());
    }

    if (options.stats) {
        const auto& stats = join.relation_stats();
        print_success("Joined {} rows ({} x {} input rows, build={}, encoding={})",
                      rows, left_table.num_rows(), right_table.num_rows(),
                      eqjoin::to_string(options.join.build_side), eqjoin::to_string(join.encoding()));
        print_info("Hash relation: {} keys over {} rows{}",
                   stats.num_keys, stats.num_rows, stats.key_is_unique ? " (unique keys)" : "");
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage();
        return args.empty() ? 1 : 0;
    }
    try {
        return run(parse_args(args));
    } catch (const eqjoin::ConfigurationError& e) {
        print_error("Error: {}", e.what());
        print_usage();
        return 2;
    } catch (const eqjoin::ResourceExhaustedError& e) {
        print_error("Out of memory: {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        print_error("Error: {}", e.what());
        return 1;
    }
}
