#include "exec/expression.h"
#include "exec/errors.h"
#include <limits>
#include <stdexcept>
#include <fmt/core.h>

namespace eqjoin {

namespace {

const char* op_symbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::ADD: return "+";
        case BinaryOp::SUB: return "-";
        case BinaryOp::MUL: return "*";
        case BinaryOp::DIV: return "/";
    }
    return "?";
}

bool is_numeric(TypeId type) {
    return type == TypeId::INT64 || type == TypeId::DOUBLE;
}

Datum coerce_numeric(const Datum& value) {
    if (!is_numeric(value.type)) {
        throw std::runtime_error(fmt::format("Cannot coerce {} to numeric", type_name(value.type)));
    }
    return value;
}

Datum numeric_binary(const Datum& left, const Datum& right, BinaryOp op) {
    Datum lhs = coerce_numeric(left);
    Datum rhs = coerce_numeric(right);
    bool as_double = lhs.type == TypeId::DOUBLE || rhs.type == TypeId::DOUBLE;
    if (lhs.is_null() || rhs.is_null()) {
        return Datum::null_of(as_double ? TypeId::DOUBLE : TypeId::INT64);
    }
    if (as_double) {
        double l = lhs.type == TypeId::DOUBLE ? lhs.value.f64_val : static_cast<double>(lhs.value.i64_val);
        double r = rhs.type == TypeId::DOUBLE ? rhs.value.f64_val : static_cast<double>(rhs.value.i64_val);
        switch (op) {
            case BinaryOp::ADD: return Datum::from_f64(l + r);
            case BinaryOp::SUB: return Datum::from_f64(l - r);
            case BinaryOp::MUL: return Datum::from_f64(l * r);
            case BinaryOp::DIV: return Datum::from_f64(l / r);
        }
    } else {
        int64_t l = lhs.value.i64_val;
        int64_t r = rhs.value.i64_val;
        int64_t result = 0;
        bool overflow = false;
        switch (op) {
            case BinaryOp::ADD: overflow = __builtin_add_overflow(l, r, &result); break;
            case BinaryOp::SUB: overflow = __builtin_sub_overflow(l, r, &result); break;
            case BinaryOp::MUL: overflow = __builtin_mul_overflow(l, r, &result); break;
            case BinaryOp::DIV:
                if (r == 0) throw std::runtime_error("Division by zero");
                overflow = l == std::numeric_limits<int64_t>::min() && r == -1;
                if (!overflow) result = l / r;
                break;
        }
        if (overflow) {
            throw std::runtime_error(fmt::format("Integer overflow in {} {} {}", l, op_symbol(op), r));
        }
        return Datum::from_i64(result);
    }
    throw std::runtime_error("Unsupported arithmetic operator");
}

std::unique_ptr<Expr> make_expr(ExprType type) {
    auto expr = std::make_unique<Expr>();
    expr->type = type;
    return expr;
}

}

std::string Expr::to_string() const {
    switch (type) {
        case ExprType::COLUMN_REF:
            return str_val;
        case ExprType::LITERAL_INT:
            return std::to_string(i64_val);
        case ExprType::LITERAL_DOUBLE:
            return fmt::format("{}", f64_val);
        case ExprType::LITERAL_STRING:
            return fmt::format("'{}'", str_val);
        case ExprType::LITERAL_NULL:
            return "NULL";
        case ExprType::BINARY_OP:
            return fmt::format("({} {} {})", left->to_string(), op_symbol(op), right->to_string());
    }
    return "?";
}

std::unique_ptr<Expr> Expr::clone() const {
    auto copy = make_expr(type);
    copy->str_val = str_val;
    copy->i64_val = i64_val;
    copy->f64_val = f64_val;
    copy->null_type = null_type;
    copy->op = op;
    if (left) copy->left = left->clone();
    if (right) copy->right = right->clone();
    return copy;
}

std::unique_ptr<Expr> col(std::string name) {
    auto expr = make_expr(ExprType::COLUMN_REF);
    expr->str_val = std::move(name);
    return expr;
}

std::unique_ptr<Expr> lit_i64(i64 value) {
    auto expr = make_expr(ExprType::LITERAL_INT);
    expr->i64_val = value;
    return expr;
}

std::unique_ptr<Expr> lit_f64(f64 value) {
    auto expr = make_expr(ExprType::LITERAL_DOUBLE);
    expr->f64_val = value;
    return expr;
}

std::unique_ptr<Expr> lit_text(std::string value) {
    auto expr = make_expr(ExprType::LITERAL_STRING);
    expr->str_val = std::move(value);
    return expr;
}

std::unique_ptr<Expr> lit_null(TypeId type) {
    auto expr = make_expr(ExprType::LITERAL_NULL);
    expr->null_type = type;
    return expr;
}

std::unique_ptr<Expr> binary(BinaryOp op, std::unique_ptr<Expr> left, std::unique_ptr<Expr> right) {
    auto expr = make_expr(ExprType::BINARY_OP);
    expr->op = op;
    expr->left = std::move(left);
    expr->right = std::move(right);
    return expr;
}

ExprList clone_all(const ExprList& exprs) {
    ExprList copies;
    copies.reserve(exprs.size());
    for (const auto& expr : exprs) {
        copies.push_back(expr->clone());
    }
    return copies;
}

std::string join_to_string(const ExprList& exprs) {
    std::string out;
    for (size_t i = 0; i < exprs.size(); ++i) {
        if (i > 0) out += ", ";
        out += exprs[i]->to_string();
    }
    return out;
}

ExprBindings make_bindings(const std::vector<std::string>& names,
                           const std::vector<TypeId>& types) {
    ExprBindings bindings;
    bindings.column_names = &names;
    bindings.column_types = &types;
    for (size_t i = 0; i < names.size(); ++i) {
        bindings.name_to_index[names[i]] = i;
    }
    return bindings;
}

TypeId infer_type(const Expr* expr, const ExprBindings& bindings) {
    switch (expr->type) {
        case ExprType::COLUMN_REF: {
            auto it = bindings.name_to_index.find(expr->str_val);
            if (it == bindings.name_to_index.end()) {
                throw ConfigurationError("Unknown column: " + expr->str_val);
            }
            return (*bindings.column_types)[it->second];
        }
        case ExprType::LITERAL_INT:
            return TypeId::INT64;
        case ExprType::LITERAL_DOUBLE:
            return TypeId::DOUBLE;
        case ExprType::LITERAL_STRING:
            return TypeId::TEXT;
        case ExprType::LITERAL_NULL:
            return expr->null_type;
        case ExprType::BINARY_OP: {
            TypeId left = infer_type(expr->left.get(), bindings);
            TypeId right = infer_type(expr->right.get(), bindings);
            if (!is_numeric(left) || !is_numeric(right)) {
                throw ConfigurationError(fmt::format("Arithmetic on {} and {} in {}",
                                                     type_name(left), type_name(right), expr->to_string()));
            }
            if (left == TypeId::DOUBLE || right == TypeId::DOUBLE) {
                return TypeId::DOUBLE;
            }
            return TypeId::INT64;
        }
    }
    throw ConfigurationError("Cannot infer expression type");
}

Datum evaluate_expr(const Expr* expr,
                    const Row& row,
                    const ExprBindings& bindings) {
    switch (expr->type) {
        case ExprType::COLUMN_REF: {
            auto it = bindings.name_to_index.find(expr->str_val);
            if (it == bindings.name_to_index.end()) {
                throw std::runtime_error("Unknown column: " + expr->str_val);
            }
            return row.get(it->second);
        }
        case ExprType::LITERAL_INT:
            return Datum::from_i64(expr->i64_val);
        case ExprType::LITERAL_DOUBLE:
            return Datum::from_f64(expr->f64_val);
        case ExprType::LITERAL_STRING:
            return Datum::from_text(expr->str_val);
        case ExprType::LITERAL_NULL:
            return Datum::null_of(expr->null_type);
        case ExprType::BINARY_OP: {
            Datum left = evaluate_expr(expr->left.get(), row, bindings);
            Datum right = evaluate_expr(expr->right.get(), row, bindings);
            return numeric_binary(left, right, expr->op);
        }
    }
    throw std::runtime_error("Unknown expression type");
}

}
