#pragma once

#include <tablex/core/error.hpp>
#include <tablex/expr/scalar.hpp>
#include <tablex/types/datashape.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tablex::expr {

/// Forward declarations
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;
using ExprResult = std::expected<ExprPtr, Error>;

/// Leaf: a named table with a declared tabular shape.
struct Symbol {
    std::string name;
    types::DataShape dshape;
};

/// Child restricted and reordered to `columns`.
struct Projection {
    ExprPtr child;
    std::vector<std::string> columns;
};

/// Single-column projection; the operand of scalar operators.
struct Column {
    ExprPtr child;
    std::string name;
};

/// Rows of `child` for which the boolean `predicate` holds.
struct Selection {
    ExprPtr child;
    ExprPtr predicate;
};

/// Scalar expression broadcast over the rows of one source table. Each
/// ScalarSymbol in `scalar` names a column of `child`.
struct ColumnWise {
    ExprPtr child;
    ScalarPtr scalar;
};

enum class ReductionKind : std::uint8_t {
    Any,
    All,
    Sum,
    Min,
    Max,
    Mean,
    Var,
    Std,
    Count,
    NUnique,
};

/// Collapses a single-column child to one value.
struct Reduction {
    ReductionKind kind = ReductionKind::Sum;
    ExprPtr child;
};

/// Named reductions, each over its own child. `names` and `values` are
/// parallel.
struct Summary {
    std::vector<std::string> names;
    std::vector<ExprPtr> values;
};

/// Split-apply-combine. `grouper` and `apply` are both built over `parent`.
struct By {
    ExprPtr parent;
    ExprPtr grouper;
    ExprPtr apply;
};

/// Sort key: one column, several columns, or a tabular expression.
using SortKey = std::variant<std::string, std::vector<std::string>, ExprPtr>;

struct Sort {
    ExprPtr child;
    SortKey key;
    bool ascending = true;
};

struct Distinct {
    ExprPtr child;
};

struct Head {
    ExprPtr child;
    std::size_t n = 10;
};

/// Names the single field of `child`.
struct Label {
    ExprPtr child;
    std::string label;
};

/// Renames fields of `child`; unlisted fields keep their names.
struct ReLabel {
    ExprPtr child;
    std::vector<std::pair<std::string, std::string>> labels;
};

/// Row-wise user function. The function is referenced by name; the
/// execution layer resolves it.
struct Map {
    ExprPtr child;
    std::string func;
    std::optional<types::Record> schema;
};

/// Whole-table user function.
struct Apply {
    ExprPtr child;
    std::string func;
    std::optional<types::DataShape> dshape;
};

/// Equi-join of `lhs.on_left` with `rhs.on_right`.
struct Join {
    ExprPtr lhs;
    ExprPtr rhs;
    std::string on_left;
    std::string on_right;
};

/// Expression node kinds.
/// The order of enumerators matches the alternatives of `Expr::node`.
enum class ExprKind : std::uint8_t {
    Symbol,
    Projection,
    Column,
    Selection,
    ColumnWise,
    Reduction,
    Summary,
    By,
    Sort,
    Distinct,
    Head,
    Label,
    ReLabel,
    Map,
    Apply,
    Join,
};

/// Immutable expression node.
///
/// Nodes are created through the validating factories in
/// <tablex/expr/builder.hpp> and shared through `ExprPtr`. Rewrites build new
/// nodes; no node is modified after construction.
struct Expr {
    std::variant<Symbol, Projection, Column, Selection, ColumnWise, Reduction, Summary, By, Sort,
                 Distinct, Head, Label, ReLabel, Map, Apply, Join>
        node;
    /// Structural hash, filled in by the factories. Zero when not computed.
    std::size_t hash = 0;

    [[nodiscard]] auto kind() const noexcept -> ExprKind {
        return static_cast<ExprKind>(node.index());
    }
};

[[nodiscard]] auto kind_name(ExprKind kind) noexcept -> std::string_view;
[[nodiscard]] auto reduction_name(ReductionKind kind) noexcept -> std::string_view;

/// Full shape (dimension and record) of an expression.
[[nodiscard]] auto dshape(const Expr& expr) -> std::expected<types::DataShape, Error>;

/// Record type of one row (or of the single value, for reductions and
/// summaries).
[[nodiscard]] auto schema(const Expr& expr) -> std::expected<types::Record, Error>;

/// Field names of `schema(expr)`, in order.
[[nodiscard]] auto columns(const Expr& expr) -> std::expected<std::vector<std::string>, Error>;

/// Element type of a single-field expression.
[[nodiscard]] auto dtype(const Expr& expr) -> std::expected<types::Primitive, Error>;

/// Whether the expression keeps a row dimension.
[[nodiscard]] auto is_tabular(const Expr& expr) -> std::expected<bool, Error>;

/// Structural identity: same kind, same fields, structurally equal children.
[[nodiscard]] auto structural_equal(const Expr& lhs, const Expr& rhs) -> bool;
[[nodiscard]] auto structural_hash(const Expr& expr) -> std::size_t;

struct StructuralHash {
    auto operator()(const ExprPtr& expr) const -> std::size_t { return structural_hash(*expr); }
};

struct StructuralEq {
    auto operator()(const ExprPtr& lhs, const ExprPtr& rhs) const -> bool {
        return structural_equal(*lhs, *rhs);
    }
};

}  // namespace tablex::expr
