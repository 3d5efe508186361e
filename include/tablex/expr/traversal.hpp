#pragma once

#include <tablex/expr/node.hpp>

#include <cstddef>
#include <vector>

namespace tablex::expr {

/// Direct sub-expressions, in a fixed per-kind order:
/// Selection [child, predicate], By [parent, grouper, apply], Sort [child,
/// key expression if any], Summary [values...], Join [lhs, rhs], other kinds
/// [child], Symbol [].
[[nodiscard]] auto children(const Expr& expr) -> std::vector<ExprPtr>;

/// Every node reachable from `expr`, root first (pre-order), each
/// structurally distinct node reported once.
[[nodiscard]] auto subterms(const ExprPtr& expr) -> std::vector<ExprPtr>;

/// Whether some subterm of `haystack` is structurally equal to `needle`.
[[nodiscard]] auto contains(const ExprPtr& haystack, const Expr& needle) -> bool;

/// Distinct Symbol leaves, in pre-order.
[[nodiscard]] auto leaves(const ExprPtr& expr) -> std::vector<ExprPtr>;

/// Number of nodes in the tree, counting shared subtrees once per path.
[[nodiscard]] auto node_count(const Expr& expr) -> std::size_t;

/// Rebuild `expr` with `replacement` children (same arity and order as
/// `children(expr)`), re-running the construction checks.
[[nodiscard]] auto with_children(const ExprPtr& expr, std::vector<ExprPtr> replacement)
    -> ExprResult;

/// Replace every subtree structurally equal to `from` with `to`. Unchanged
/// subtrees are shared with the input; `to` itself is not searched.
[[nodiscard]] auto substitute(const ExprPtr& expr, const Expr& from, const ExprPtr& to)
    -> ExprResult;

}  // namespace tablex::expr
