#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include "types.h"
#include "storage/table.h"

namespace eqjoin {

struct CsvOptions {
    // Shared so that STRING ids of several tables are comparable. A fresh
    // dictionary is created when empty.
    std::shared_ptr<Dictionary> dict;
    // When false, string columns load as TEXT instead of dictionary ids.
    bool dictionary_encode = true;
    char delimiter = ',';
};

// Loads a headed CSV, inferring DATE32, INT64, DOUBLE, then STRING/TEXT per
// column. Empty cells become nulls.
Table load_csv(const std::string& filename, const CsvOptions& options = {});
Table load_csv(std::istream& input, const CsvOptions& options = {});

} // namespace eqjoin
