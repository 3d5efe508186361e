#pragma once

#include <tablex/core/error.hpp>
#include <tablex/types/datashape.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace tablex::expr {

/// Scalar expression evaluated once per row of a broadcast's source table.
struct ScalarExpr;
using ScalarPtr = std::shared_ptr<const ScalarExpr>;

using LiteralValue = std::variant<bool, std::int64_t, double, std::string>;

/// Placeholder for one column of the source table.
struct ScalarSymbol {
    std::string name;
    types::Primitive type = types::Primitive::Int64;
};

struct ScalarLiteral {
    LiteralValue value;
};

enum class UnaryOp : std::uint8_t {
    Neg,
    Not,
    Abs,
    Sin,
    Cos,
    Tan,
    Exp,
    Log,
};

enum class BinaryOp : std::uint8_t {
    // Arithmetic
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    // Comparison
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    // Logical
    And,
    Or,
};

struct ScalarUnary {
    UnaryOp op = UnaryOp::Neg;
    ScalarPtr operand;
};

struct ScalarBinary {
    BinaryOp op = BinaryOp::Add;
    ScalarPtr left;
    ScalarPtr right;
};

struct ScalarExpr {
    std::variant<ScalarSymbol, ScalarLiteral, ScalarUnary, ScalarBinary> node;
};

[[nodiscard]] auto scalar_symbol(std::string name, types::Primitive type) -> ScalarPtr;
[[nodiscard]] auto scalar_literal(LiteralValue value) -> ScalarPtr;
[[nodiscard]] auto scalar_unary(UnaryOp op, ScalarPtr operand) -> ScalarPtr;
[[nodiscard]] auto scalar_binary(BinaryOp op, ScalarPtr left, ScalarPtr right) -> ScalarPtr;

[[nodiscard]] auto is_comparison(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto is_logical(BinaryOp op) noexcept -> bool;
[[nodiscard]] auto literal_type(const LiteralValue& value) noexcept -> types::Primitive;

/// Infer the element type of a scalar expression.
[[nodiscard]] auto dtype(const ScalarExpr& expr) -> std::expected<types::Primitive, Error>;

/// Placeholder names, sorted and deduplicated.
[[nodiscard]] auto symbol_names(const ScalarExpr& expr) -> std::vector<std::string>;

/// First placeholder met in a left-to-right walk, or nullptr.
[[nodiscard]] auto first_symbol(const ScalarExpr& expr) -> const ScalarSymbol*;

[[nodiscard]] auto scalar_equal(const ScalarExpr& lhs, const ScalarExpr& rhs) -> bool;
[[nodiscard]] auto scalar_hash(const ScalarExpr& expr) -> std::size_t;

/// Render with infix operators. `symbol_text` maps a placeholder name to its
/// rendering; the default prints the bare name.
[[nodiscard]] auto to_string(const ScalarExpr& expr,
                             const std::function<std::string(const std::string&)>& symbol_text =
                                 nullptr) -> std::string;

[[nodiscard]] auto to_string(UnaryOp op) -> std::string_view;
[[nodiscard]] auto to_string(BinaryOp op) -> std::string_view;

}  // namespace tablex::expr
