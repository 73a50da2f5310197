#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.h"
#include "exec/row.hpp"

namespace eqjoin {

// Types of expressions usable as join keys
enum class ExprType {
    COLUMN_REF,
    LITERAL_INT,
    LITERAL_DOUBLE,
    LITERAL_STRING,
    LITERAL_NULL,
    BINARY_OP
};

// Arithmetic operators
enum class BinaryOp {
    ADD, SUB, MUL, DIV
};

// Expression tree node
struct Expr {
    ExprType type;
    // For literals: use separate fields since no variant
    std::string str_val;
    i64 i64_val = 0;
    f64 f64_val = 0.0;
    TypeId null_type = TypeId::INT64; // for LITERAL_NULL
    BinaryOp op = BinaryOp::ADD; // for binary
    std::unique_ptr<Expr> left, right; // for binary

    std::string to_string() const;
    std::unique_ptr<Expr> clone() const;
};

using ExprList = std::vector<std::unique_ptr<Expr>>;

std::unique_ptr<Expr> col(std::string name);
std::unique_ptr<Expr> lit_i64(i64 value);
std::unique_ptr<Expr> lit_f64(f64 value);
std::unique_ptr<Expr> lit_text(std::string value);
std::unique_ptr<Expr> lit_null(TypeId type);
std::unique_ptr<Expr> binary(BinaryOp op, std::unique_ptr<Expr> left, std::unique_ptr<Expr> right);

ExprList clone_all(const ExprList& exprs);
std::string join_to_string(const ExprList& exprs);

// Resolves column names against a row schema. The name and type vectors are
// borrowed and must outlive the bindings.
struct ExprBindings {
    const std::vector<std::string>* column_names;
    const std::vector<TypeId>* column_types;
    std::unordered_map<std::string, size_t> name_to_index;
};

ExprBindings make_bindings(const std::vector<std::string>& names,
                           const std::vector<TypeId>& types);

// Result type of `expr`; throws ConfigurationError for unknown columns
// or operands that are not numeric.
TypeId infer_type(const Expr* expr, const ExprBindings& bindings);

// Null operands yield a null of the result type.
Datum evaluate_expr(const Expr* expr,
                    const Row& row,
                    const ExprBindings& bindings);

}
