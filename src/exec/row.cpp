#include "exec/row.hpp"
#include "exec/errors.h"
#include "exec/row_encoding.hpp"
#include <bit>
#include <cmath>
#include <functional>
#include <limits>
#include <string>
#include <fmt/core.h>

namespace eqjoin {

namespace {

constexpr size_t kNullHash = 0x5bd1e995;

inline void hash_combine(size_t& seed, size_t h) {
    seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

// -0.0 folds into +0.0 and every NaN into one pattern.
uint64_t canonical_double_bits(double v) {
    if (std::isnan(v)) {
        return std::bit_cast<uint64_t>(std::numeric_limits<double>::quiet_NaN());
    }
    if (v == 0.0) {
        return 0;
    }
    return std::bit_cast<uint64_t>(v);
}

size_t hash_datum(const Datum& value) {
    if (value.is_null()) {
        return kNullHash;
    }
    switch (value.type) {
        case TypeId::INT64:
            return std::hash<int64_t>{}(value.value.i64_val);
        case TypeId::DOUBLE:
            return std::hash<uint64_t>{}(canonical_double_bits(value.value.f64_val));
        case TypeId::STRING:
            return std::hash<uint32_t>{}(value.value.str_id);
        case TypeId::DATE32:
            return std::hash<int32_t>{}(value.value.date32_val);
        case TypeId::TEXT:
            return std::hash<std::string>{}(value.text);
    }
    return 0;
}

bool datum_equal(const Datum& a, const Datum& b) {
    if (a.type != b.type) return false;
    if (a.is_null() || b.is_null()) return a.is_null() == b.is_null();
    switch (a.type) {
        case TypeId::INT64:
            return a.value.i64_val == b.value.i64_val;
        case TypeId::DOUBLE:
            return canonical_double_bits(a.value.f64_val) == canonical_double_bits(b.value.f64_val);
        case TypeId::STRING:
            return a.value.str_id == b.value.str_id;
        case TypeId::DATE32:
            return a.value.date32_val == b.value.date32_val;
        case TypeId::TEXT:
            return a.text == b.text;
    }
    return false;
}

}

const char* to_string(RowEncoding encoding) {
    switch (encoding) {
        case RowEncoding::PACKED: return "packed";
        case RowEncoding::GENERIC: return "generic";
    }
    return "unknown";
}

bool GenericRow::any_null() const {
    for (const auto& value : values) {
        if (value.is_null()) return true;
    }
    return false;
}

size_t GenericRow::hash() const {
    size_t seed = 0;
    for (const auto& value : values) {
        hash_combine(seed, hash_datum(value));
    }
    return seed;
}

bool GenericRow::operator==(const GenericRow& other) const {
    if (values.size() != other.values.size()) {
        return false;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!datum_equal(values[i], other.values[i])) return false;
    }
    return true;
}

bool PackedRow::is_null(size_t i) const {
    if (i >= num_fields()) {
        throw std::out_of_range(fmt::format("Field {} out of range for packed row of {} fields", i, num_fields()));
    }
    return (words_[i / 64] >> (i % 64)) & 1ULL;
}

Datum PackedRow::get(size_t i) const {
    bool null = is_null(i);
    TypeId type = (*schema_)[i];
    if (null) {
        return Datum::null_of(type);
    }
    uint64_t slot = words_[bitset_words(num_fields()) + i];
    switch (type) {
        case TypeId::INT64:
            return Datum::from_i64(static_cast<int64_t>(slot));
        case TypeId::DOUBLE:
            return Datum::from_f64(std::bit_cast<double>(slot));
        case TypeId::STRING:
            return Datum::from_str(static_cast<StrId>(slot));
        case TypeId::DATE32:
            return Datum::from_date32(static_cast<Date32>(static_cast<int64_t>(slot)));
        case TypeId::TEXT:
            break;
    }
    throw std::runtime_error("Packed row holds an unsupported type");
}

bool PackedRow::any_null() const {
    size_t bitset = bitset_words(num_fields());
    for (size_t w = 0; w < bitset; ++w) {
        if (words_[w] != 0) return true;
    }
    return false;
}

size_t PackedRow::hash() const {
    size_t seed = words_.size();
    for (uint64_t word : words_) {
        hash_combine(seed, std::hash<uint64_t>{}(word));
    }
    return seed;
}

bool PackedRow::operator==(const PackedRow& other) const {
    if (num_fields() != other.num_fields()) return false;
    return words_ == other.words_;
}

PackedRowWriter::PackedRowWriter(std::vector<TypeId> types) {
    for (size_t i = 0; i < types.size(); ++i) {
        if (!packed_supports(types[i])) {
            throw ConfigurationError(fmt::format("Packed rows cannot hold {} (field {})", type_name(types[i]), i));
        }
    }
    schema_ = std::make_shared<const std::vector<TypeId>>(std::move(types));
}

void PackedRowWriter::begin(PackedRow& out) const {
    size_t n = schema_->size();
    out.schema_ = schema_;
    out.words_.assign(PackedRow::bitset_words(n) + n, 0);
}

void PackedRowWriter::write(PackedRow& out, size_t i, const Datum& value) const {
    if (value.is_null()) {
        out.words_[i / 64] |= 1ULL << (i % 64);
        return;
    }
    uint64_t& slot = out.words_[PackedRow::bitset_words(schema_->size()) + i];
    switch ((*schema_)[i]) {
        case TypeId::INT64:
            slot = static_cast<uint64_t>(value.as_i64());
            break;
        case TypeId::DOUBLE:
            slot = canonical_double_bits(value.as_f64());
            break;
        case TypeId::STRING:
            slot = value.as_str();
            break;
        case TypeId::DATE32:
            slot = static_cast<uint64_t>(static_cast<int64_t>(value.as_date32()));
            break;
        case TypeId::TEXT:
            throw std::runtime_error("Packed row holds an unsupported type");
    }
}

size_t PackedRowWriter::copy_fields(const Row& src, PackedRow& out, size_t offset) const {
    size_t n = src.num_fields();
    if (offset + n > schema_->size()) {
        throw std::runtime_error(fmt::format("Row of {} fields does not fit packed schema of {}", offset + n, schema_->size()));
    }
    const PackedRow* packed = src.packed();
    if (packed && offset == 0 && n == schema_->size() && *packed->schema_ == *schema_) {
        out.words_ = packed->words_;
        return n;
    }
    for (size_t i = 0; i < n; ++i) {
        write(out, offset + i, src.get(i));
    }
    return n;
}

void PackedRowWriter::encode(const Row& src, PackedRow& out) const {
    if (src.num_fields() != schema_->size()) {
        throw std::runtime_error(fmt::format("Expected {} fields, got {}", schema_->size(), src.num_fields()));
    }
    begin(out);
    copy_fields(src, out, 0);
}

void PackedRowWriter::encode_joined(const Row& left, const Row& right, PackedRow& out) const {
    if (left.num_fields() + right.num_fields() != schema_->size()) {
        throw std::runtime_error(fmt::format("Expected {} fields, got {}", schema_->size(), left.num_fields() + right.num_fields()));
    }
    begin(out);
    size_t offset = copy_fields(left, out, 0);
    copy_fields(right, out, offset);
}

PackedRow PackedRowWriter::encode(const std::vector<Datum>& values) const {
    if (values.size() != schema_->size()) {
        throw std::runtime_error(fmt::format("Expected {} fields, got {}", schema_->size(), values.size()));
    }
    PackedRow out;
    begin(out);
    for (size_t i = 0; i < values.size(); ++i) {
        write(out, i, values[i]);
    }
    return out;
}

size_t Row::num_fields() const {
    return std::visit([](const auto& row) { return row.num_fields(); }, repr_);
}

bool Row::is_null(size_t i) const {
    return std::visit([i](const auto& row) { return row.is_null(i); }, repr_);
}

Datum Row::get(size_t i) const {
    return std::visit([i](const auto& row) { return Datum(row.get(i)); }, repr_);
}

bool Row::any_null() const {
    return std::visit([](const auto& row) { return row.any_null(); }, repr_);
}

size_t Row::hash() const {
    return std::visit([](const auto& row) { return row.hash(); }, repr_);
}

} // namespace eqjoin
