#pragma once

#include <memory>
#include <string>
#include <vector>
#include "types.h"
#include "exec/row.hpp"
#include "exec/formatter.hpp"
#include "storage/table.h"

namespace eqjoin {

// Physical operator interface. Rows are pulled one at a time; `next`
// overwrites `out` and returns false once the input is exhausted.
struct Operator {
    virtual ~Operator() = default;
    virtual void open() = 0;
    virtual bool next(Row& out) = 0;
    virtual void close() = 0;

    const std::vector<std::string>& output_names() const { return names_; }
    const std::vector<TypeId>& output_types() const { return types_; }
    Dictionary* dictionary() const { return dict_; }

protected:
    std::vector<std::string> names_;
    std::vector<TypeId> types_;
    Dictionary* dict_ = nullptr;
};

// Emits the rows of a table as generic rows.
struct TableScan : public Operator {
    TableScan(const Table* t, std::vector<size_t> idx = {});

    void open() override;
    bool next(Row& out) override;
    void close() override;

private:
    const Table* table;
    std::vector<size_t> indices;
    size_t offset = 0;
};

// Emits a fixed sequence of rows, as given.
struct RowsScan : public Operator {
    RowsScan(std::vector<std::string> names,
             std::vector<TypeId> types,
             std::vector<Row> rows,
             Dictionary* dict = nullptr);

    void open() override;
    bool next(Row& out) override;
    void close() override;

private:
    std::vector<Row> rows;
    size_t offset = 0;
};

std::string render_datum(const Datum& value, const Dictionary* dict);

// Execution driver; returns the number of rows written.
size_t run_query(Operator& root,
                 Formatter& formatter,
                 const Dictionary* dict = nullptr);

}
