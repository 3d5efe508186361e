#pragma once

#include <tablex/expr/node.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tablex::expr {

// ─── Validating node factories ────────────────────────────────────────────────
//  Every factory checks the invariants of its node kind against the schemas
//  of its children and fails with a construction error instead of producing a
//  node whose schema would be wrong.

/// Table leaf. `dshape` must be tabular with a record measure.
[[nodiscard]] auto symbol(std::string name, types::DataShape dshape) -> ExprResult;

/// Table leaf from a schema string such as `var * {a: int32, b: string}`.
[[nodiscard]] auto symbol(std::string name, std::string_view dshape_text) -> ExprResult;

/// Columns must be distinct members of the child's schema.
[[nodiscard]] auto projection(ExprPtr child, std::vector<std::string> columns) -> ExprResult;

[[nodiscard]] auto column(ExprPtr child, std::string name) -> ExprResult;

/// `predicate` must be tabular with a single bool field.
[[nodiscard]] auto selection(ExprPtr child, ExprPtr predicate) -> ExprResult;

/// Broadcast node. Every placeholder of `scalar` must name a column of
/// `child` with the placeholder's type. See <tablex/expr/columnwise.hpp> for
/// building one from column operands.
[[nodiscard]] auto broadcast(ExprPtr child, ScalarPtr scalar) -> ExprResult;

/// `child` must have exactly one field.
[[nodiscard]] auto reduction(ReductionKind kind, ExprPtr child) -> ExprResult;

/// Named reductions. Names must be unique; values must be single-field and
/// without a row dimension.
[[nodiscard]] auto summary(std::vector<std::pair<std::string, ExprPtr>> entries) -> ExprResult;

/// Grouping. `grouper` must be tabular, `apply` must reduce, and both must
/// contain `parent`.
[[nodiscard]] auto by(ExprPtr parent, ExprPtr grouper, ExprPtr apply) -> ExprResult;

[[nodiscard]] auto sort(ExprPtr child, SortKey key, bool ascending = true) -> ExprResult;

[[nodiscard]] auto distinct(ExprPtr child) -> ExprResult;

[[nodiscard]] auto head(ExprPtr child, std::size_t n = 10) -> ExprResult;

/// A multi-field child is accepted here and reported by `schema()`.
[[nodiscard]] auto label(ExprPtr child, std::string label) -> ExprResult;

/// Keys must be columns of the child; renamed fields must stay unique.
[[nodiscard]] auto relabel(ExprPtr child, std::vector<std::pair<std::string, std::string>> labels)
    -> ExprResult;

[[nodiscard]] auto map(ExprPtr child, std::string func,
                       std::optional<types::Record> schema = std::nullopt) -> ExprResult;

[[nodiscard]] auto apply(ExprPtr child, std::string func,
                         std::optional<types::DataShape> declared = std::nullopt) -> ExprResult;

/// Equi-join. An empty `on_right` joins on a column named `on_left` on both
/// sides.
[[nodiscard]] auto join(ExprPtr lhs, ExprPtr rhs, std::string on_left, std::string on_right = {})
    -> ExprResult;

}  // namespace tablex::expr
