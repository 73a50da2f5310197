#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>
#include "types.h"

namespace eqjoin {

// Physical row representation, fixed once per join operator.
enum class RowEncoding { PACKED, GENERIC };

const char* to_string(RowEncoding encoding);

// Boxed fallback encoding: one Datum per field.
struct GenericRow {
    std::vector<Datum> values;

    size_t num_fields() const { return values.size(); }
    bool is_null(size_t i) const { return values.at(i).is_null(); }
    const Datum& get(size_t i) const { return values.at(i); }
    bool any_null() const;
    size_t hash() const;
    bool operator==(const GenericRow& other) const;
};

// Binary encoding: a null bitset (64 fields per word) followed by one
// 8-byte slot per field. Only fixed-width types are representable.
// Null slots are zero and doubles are canonical, so two rows holding equal
// values hold identical words.
class PackedRow {
public:
    PackedRow() = default;

    size_t num_fields() const { return schema_ ? schema_->size() : 0; }
    bool is_null(size_t i) const;
    Datum get(size_t i) const;
    bool any_null() const;
    size_t hash() const;
    bool operator==(const PackedRow& other) const;

    const std::vector<uint64_t>& words() const { return words_; }
    const std::shared_ptr<const std::vector<TypeId>>& schema() const { return schema_; }

    static size_t bitset_words(size_t num_fields) { return (num_fields + 63) / 64; }

private:
    friend class PackedRowWriter;

    std::shared_ptr<const std::vector<TypeId>> schema_;
    std::vector<uint64_t> words_;
};

class Row;

// Encodes field sequences into PackedRows. The schema is shared by every row
// the writer produces, so encoding allocates nothing once the target's buffer
// has grown to size.
class PackedRowWriter {
public:
    explicit PackedRowWriter(std::vector<TypeId> types);

    const std::vector<TypeId>& types() const { return *schema_; }

    // Overwrites `out` with the fields of `src`.
    void encode(const Row& src, PackedRow& out) const;
    // Overwrites `out` with the fields of `left` followed by those of `right`.
    void encode_joined(const Row& left, const Row& right, PackedRow& out) const;
    // Encodes a standalone row from loose values.
    PackedRow encode(const std::vector<Datum>& values) const;

private:
    void begin(PackedRow& out) const;
    void write(PackedRow& out, size_t i, const Datum& value) const;
    size_t copy_fields(const Row& src, PackedRow& out, size_t offset) const;

    std::shared_ptr<const std::vector<TypeId>> schema_;
};

// A row in either encoding. Rows of different encodings never compare equal.
class Row {
public:
    Row() : repr_(GenericRow{}) {}
    Row(GenericRow row) : repr_(std::move(row)) {}
    Row(PackedRow row) : repr_(std::move(row)) {}

    RowEncoding encoding() const {
        return std::holds_alternative<PackedRow>(repr_) ? RowEncoding::PACKED : RowEncoding::GENERIC;
    }

    size_t num_fields() const;
    bool is_null(size_t i) const;
    Datum get(size_t i) const;
    bool any_null() const;
    size_t hash() const;
    bool operator==(const Row& other) const { return repr_ == other.repr_; }

    const PackedRow* packed() const { return std::get_if<PackedRow>(&repr_); }
    PackedRow* packed() { return std::get_if<PackedRow>(&repr_); }
    const GenericRow* generic() const { return std::get_if<GenericRow>(&repr_); }
    GenericRow* generic() { return std::get_if<GenericRow>(&repr_); }

    static Row of(std::vector<Datum> values) { return Row(GenericRow{std::move(values)}); }

private:
    std::variant<PackedRow, GenericRow> repr_;
};

// A join key is a row of key-expression results.
using KeyTuple = Row;

struct RowHash {
    size_t operator()(const Row& row) const { return row.hash(); }
};

struct RowEqual {
    bool operator()(const Row& lhs, const Row& rhs) const { return lhs == rhs; }
};

} // namespace eqjoin
