#pragma once

#include <tablex/expr/node.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace tablex::expr {

/// One input of a fused column-wise operation: a column-like expression
/// (`Column` or `ColumnWise`) or a literal.
struct Operand {
    std::variant<ExprPtr, LiteralValue> value;

    Operand(ExprPtr expr) : value(std::move(expr)) {}
    Operand(LiteralValue literal) : value(std::move(literal)) {}
    Operand(bool literal) : value(LiteralValue{literal}) {}
    Operand(int literal) : value(LiteralValue{std::int64_t{literal}}) {}
    Operand(std::int64_t literal) : value(LiteralValue{literal}) {}
    Operand(double literal) : value(LiteralValue{literal}) {}
    Operand(std::string literal) : value(LiteralValue{std::move(literal)}) {}
    Operand(const char* literal) : value(LiteralValue{std::string(literal)}) {}
};

/// Combines the per-operand scalars into the fused scalar.
using ScalarCombiner = std::function<ScalarPtr(std::vector<ScalarPtr>)>;

/// Fuse column-like operands into a single `ColumnWise` node over their one
/// source table.
///
/// An existing `ColumnWise` contributes its scalar and source table; a
/// `Column` contributes a placeholder named after the column; a literal
/// contributes itself and no table. Fails with `MismatchedSourceTable` when
/// the operands come from more than one table, and with `InvalidArgument`
/// for any other node kind or when no operand carries a table.
[[nodiscard]] auto fuse(std::vector<Operand> inputs, const ScalarCombiner& combine) -> ExprResult;

[[nodiscard]] auto columnwise(BinaryOp op, Operand lhs, Operand rhs) -> ExprResult;
[[nodiscard]] auto columnwise(UnaryOp op, Operand operand) -> ExprResult;

/// Placeholder names referenced by the broadcast, sorted and deduplicated.
[[nodiscard]] auto active_columns(const ColumnWise& node) -> std::vector<std::string>;

}  // namespace tablex::expr
