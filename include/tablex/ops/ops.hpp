#pragma once

#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/node.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tablex::ops {

// ─── Expression handle ────────────────────────────────────────────────────────
//  A thin value wrapper over `expr::ExprPtr` that reads like the query it
//  builds. Every member goes through the validating factories of
//  <tablex/expr/builder.hpp> and throws `tablex::Exception` on failure.

class Expression {
   public:
    explicit Expression(expr::ExprPtr node);

    [[nodiscard]] auto node() const noexcept -> const expr::ExprPtr& { return node_; }
    [[nodiscard]] auto kind() const noexcept -> expr::ExprKind { return node_->kind(); }

    [[nodiscard]] auto dshape() const -> types::DataShape;
    [[nodiscard]] auto schema() const -> types::Record;
    [[nodiscard]] auto columns() const -> std::vector<std::string>;
    [[nodiscard]] auto dtype() const -> types::Primitive;
    [[nodiscard]] auto to_string() const -> std::string;

    /// `t["a"]`: one column.
    [[nodiscard]] auto operator[](std::string name) const -> Expression;
    /// `t[std::vector<std::string>{"a", "b"}]`: projection.
    [[nodiscard]] auto operator[](std::vector<std::string> names) const -> Expression;
    /// `t[t["a"] > 0]`: selection.
    [[nodiscard]] auto operator[](const Expression& predicate) const -> Expression;

    [[nodiscard]] auto any() const -> Expression;
    [[nodiscard]] auto all() const -> Expression;
    [[nodiscard]] auto sum() const -> Expression;
    [[nodiscard]] auto min() const -> Expression;
    [[nodiscard]] auto max() const -> Expression;
    [[nodiscard]] auto mean() const -> Expression;
    [[nodiscard]] auto var() const -> Expression;
    [[nodiscard]] auto stddev() const -> Expression;
    [[nodiscard]] auto count() const -> Expression;
    [[nodiscard]] auto nunique() const -> Expression;

    [[nodiscard]] auto distinct() const -> Expression;
    [[nodiscard]] auto head(std::size_t n = 10) const -> Expression;
    /// Ascending on the first column.
    [[nodiscard]] auto sort() const -> Expression;
    [[nodiscard]] auto sort(expr::SortKey key, bool ascending = true) const -> Expression;
    [[nodiscard]] auto label(std::string name) const -> Expression;
    [[nodiscard]] auto relabel(std::vector<std::pair<std::string, std::string>> labels) const
        -> Expression;
    [[nodiscard]] auto map(std::string func,
                           std::optional<types::Record> schema = std::nullopt) const -> Expression;
    [[nodiscard]] auto apply(std::string func,
                             std::optional<types::DataShape> declared = std::nullopt) const
        -> Expression;

   private:
    expr::ExprPtr node_;
};

/// Throws `tablex::Exception` carrying the error.
[[nodiscard]] auto unwrap(expr::ExprResult result) -> Expression;

[[nodiscard]] auto symbol(std::string name, std::string_view dshape) -> Expression;

[[nodiscard]] auto summary(std::vector<std::pair<std::string, Expression>> entries) -> Expression;

/// Group `apply` by `grouper`; the parent is their common sub-expression.
[[nodiscard]] auto by(const Expression& grouper, const Expression& apply) -> Expression;

[[nodiscard]] auto join(const Expression& lhs, const Expression& rhs, std::string on_left,
                        std::string on_right = {}) -> Expression;

[[nodiscard]] auto lean_projection(const Expression& expr) -> Expression;

// ─── Column-wise operators ────────────────────────────────────────────────────
//  Operators fuse their operands through expr::columnwise. At least one side
//  must be an Expression; the other may be an Expression or a literal.

template <typename T>
concept IsExpression = std::same_as<std::remove_cvref_t<T>, Expression>;

template <typename T>
concept OperandLike = IsExpression<T> || std::convertible_to<T, expr::Operand>;

template <typename L, typename R>
concept ColumnOperands = OperandLike<L> && OperandLike<R> && (IsExpression<L> || IsExpression<R>);

[[nodiscard]] inline auto as_operand(const Expression& e) -> expr::Operand {
    return e.node();
}

template <typename T>
    requires(!IsExpression<T>)
[[nodiscard]] auto as_operand(T&& value) -> expr::Operand {
    return expr::Operand(std::forward<T>(value));
}

[[nodiscard]] auto binary(expr::BinaryOp op, expr::Operand lhs, expr::Operand rhs) -> Expression;
[[nodiscard]] auto unary(expr::UnaryOp op, const Expression& operand) -> Expression;

#define TABLEX_OPS_BINARY(token, op)                                           \
    template <typename L, typename R>                                          \
        requires ColumnOperands<L, R>                                          \
    [[nodiscard]] auto operator token(L&& lhs, R&& rhs) -> Expression {       \
        return binary(op, as_operand(std::forward<L>(lhs)),                    \
                      as_operand(std::forward<R>(rhs)));                       \
    }

TABLEX_OPS_BINARY(+, expr::BinaryOp::Add)
TABLEX_OPS_BINARY(-, expr::BinaryOp::Sub)
TABLEX_OPS_BINARY(*, expr::BinaryOp::Mul)
TABLEX_OPS_BINARY(/, expr::BinaryOp::Div)
TABLEX_OPS_BINARY(%, expr::BinaryOp::Mod)
TABLEX_OPS_BINARY(==, expr::BinaryOp::Eq)
TABLEX_OPS_BINARY(!=, expr::BinaryOp::Ne)
TABLEX_OPS_BINARY(<, expr::BinaryOp::Lt)
TABLEX_OPS_BINARY(<=, expr::BinaryOp::Le)
TABLEX_OPS_BINARY(>, expr::BinaryOp::Gt)
TABLEX_OPS_BINARY(>=, expr::BinaryOp::Ge)
TABLEX_OPS_BINARY(&, expr::BinaryOp::And)
TABLEX_OPS_BINARY(|, expr::BinaryOp::Or)

#undef TABLEX_OPS_BINARY

template <typename L, typename R>
    requires ColumnOperands<L, R>
[[nodiscard]] auto pow(L&& lhs, R&& rhs) -> Expression {
    return binary(expr::BinaryOp::Pow, as_operand(std::forward<L>(lhs)),
                  as_operand(std::forward<R>(rhs)));
}

[[nodiscard]] auto operator-(const Expression& operand) -> Expression;
[[nodiscard]] auto operator~(const Expression& operand) -> Expression;
[[nodiscard]] auto abs(const Expression& operand) -> Expression;
[[nodiscard]] auto sin(const Expression& operand) -> Expression;
[[nodiscard]] auto cos(const Expression& operand) -> Expression;
[[nodiscard]] auto tan(const Expression& operand) -> Expression;
[[nodiscard]] auto exp(const Expression& operand) -> Expression;
[[nodiscard]] auto log(const Expression& operand) -> Expression;

}  // namespace tablex::ops
