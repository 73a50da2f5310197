#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace eqjoin {

using i64 = int64_t;
using f64 = double;
using StrId = uint32_t;  // Dictionary-encoded string ID
using Date32 = int32_t;  // YYYYMMDD format

// Enumeration of supported data types
enum class TypeId { INT64, DOUBLE, STRING, DATE32, TEXT };

const char* type_name(TypeId type);

// Datum union for type-safe value storage
union DatumValue {
    int64_t i64_val;
    double f64_val;
    StrId str_id;
    Date32 date32_val;
};

// Type-safe wrapper for a single value with its type.
// TEXT values live in `text`; every other type lives in the union.
struct Datum {
    TypeId type;
    DatumValue value;
    bool null = false;
    std::string text;

    bool is_null() const { return null; }

    // Type-safe accessors
    int64_t as_i64() const {
        if (type != TypeId::INT64) throw std::runtime_error("Type mismatch");
        return value.i64_val;
    }

    double as_f64() const {
        if (type != TypeId::DOUBLE) throw std::runtime_error("Type mismatch");
        return value.f64_val;
    }

    StrId as_str() const {
        if (type != TypeId::STRING) throw std::runtime_error("Type mismatch");
        return value.str_id;
    }

    Date32 as_date32() const {
        if (type != TypeId::DATE32) throw std::runtime_error("Type mismatch");
        return value.date32_val;
    }

    const std::string& as_text() const {
        if (type != TypeId::TEXT) throw std::runtime_error("Type mismatch");
        return text;
    }

    // Static constructors
    static Datum from_i64(int64_t v) {
        return {TypeId::INT64, {.i64_val = v}};
    }

    static Datum from_f64(double v) {
        return {TypeId::DOUBLE, {.f64_val = v}};
    }

    static Datum from_str(StrId v) {
        return {TypeId::STRING, {.str_id = v}};
    }

    static Datum from_date32(Date32 v) {
        return {TypeId::DATE32, {.date32_val = v}};
    }

    static Datum from_text(std::string v) {
        return {TypeId::TEXT, {.i64_val = 0}, false, std::move(v)};
    }

    static Datum null_of(TypeId t) {
        return {t, {.i64_val = 0}, true};
    }
};

// Type mapping helper
template<typename T>
TypeId type_id_for();

template<>
inline TypeId type_id_for<int64_t>() { return TypeId::INT64; }

template<>
inline TypeId type_id_for<double>() { return TypeId::DOUBLE; }

template<>
inline TypeId type_id_for<int32_t>() { return TypeId::DATE32; }

template<>
inline TypeId type_id_for<uint32_t>() { return TypeId::STRING; }

template<>
inline TypeId type_id_for<std::string>() { return TypeId::TEXT; }

// Base class
struct Column {
    virtual ~Column() {}
    virtual TypeId type() const = 0;
    virtual size_t size() const = 0;
    virtual bool is_null(size_t row) const = 0;
};

// Typed column. `nulls` is either empty (no nulls) or one flag per row.
template<typename T>
struct ColumnVector : public Column {
    std::vector<T> data;
    std::vector<uint8_t> nulls;

    explicit ColumnVector(size_t reserve = 0) { data.reserve(reserve); }
    explicit ColumnVector(std::vector<T> d) : data(std::move(d)) {}
    ColumnVector(std::vector<T> d, std::vector<uint8_t> n) : data(std::move(d)), nulls(std::move(n)) {
        if (!nulls.empty() && nulls.size() != data.size()) {
            throw std::runtime_error("Null mask length mismatch");
        }
    }

    TypeId type() const override { return type_id_for<T>(); }
    size_t size() const override { return data.size(); }
    bool is_null(size_t row) const override { return !nulls.empty() && nulls[row] != 0; }

    void append(const T& v) {
        data.push_back(v);
        if (!nulls.empty()) nulls.push_back(0);
    }

    void append_null() {
        if (nulls.empty()) nulls.assign(data.size(), 0);
        data.push_back(T{});
        nulls.push_back(1);
    }
};

} // namespace eqjoin
