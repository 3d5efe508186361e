#pragma once

#include <tablex/expr/node.hpp>
#include <tablex/optimize/common_subexpression.hpp>

#include <expected>
#include <set>
#include <string>

namespace tablex::optimize {

/// Field names, ordered so leaf projections come out sorted.
using FieldSet = std::set<std::string>;

/// A rewritten subtree and the fields it needs from its input.
struct Leaned {
    expr::ExprPtr expr;
    FieldSet fields;
};

using LeanResult = std::expected<Leaned, Error>;

/// Projection pushdown.
///
/// Rewrites an expression so that every table leaf is wrapped in a projection
/// onto the columns the rest of the tree actually reads. The rewritten tree
/// has the same schema as the input.
///
/// Usage:
///   LeanProjection optimizer;
///   auto lean = optimizer.run(expr);
class LeanProjection {
   public:
    struct Config {
        /// Share one node between structurally identical rewritten subtrees.
        bool intern = true;
        /// Re-project the root when sorted leaf projections reorder its columns.
        bool restore_column_order = true;
    };

    LeanProjection();
    explicit LeanProjection(Config config);

    /// Rewrite `expr` for its own columns.
    [[nodiscard]] auto run(const expr::ExprPtr& expr) -> expr::ExprResult;

    /// Rewrite `expr` for the `requested` fields of its output. An empty
    /// request stands for every output field. Fails with `UnknownField` when a
    /// requested field is not an output of `expr`.
    [[nodiscard]] auto lean(const expr::ExprPtr& expr, const FieldSet& requested) -> LeanResult;

    /// Re-lean `shared`, the input two branches have in common, for the
    /// `needed` fields only. Returns it unchanged when it already exposes
    /// exactly those fields, and fails with `InternalConsistency` when it
    /// lacks one of them.
    [[nodiscard]] auto narrow(const expr::ExprPtr& shared, const FieldSet& needed) -> LeanResult;

    [[nodiscard]] auto interned() const noexcept -> std::size_t { return interner_.size(); }

   private:
    struct Rules;

    auto visit(const expr::ExprPtr& expr, const FieldSet& requested) -> LeanResult;
    auto keep(expr::ExprResult rebuilt) -> expr::ExprResult;

    Config config_;
    Interner interner_;
};

/// Columns of `source` that `term` reads wherever it consumes `source`
/// directly. A projection, column or column-wise consumer reads the names it
/// uses; any other consumer, or `term` being `source` itself, reads them all.
[[nodiscard]] auto columns_read(const expr::ExprPtr& term, const expr::Expr& source)
    -> std::expected<FieldSet, Error>;

/// `LeanProjection{}.run(expr)`.
[[nodiscard]] auto lean_projection(const expr::ExprPtr& expr) -> expr::ExprResult;

/// `LeanProjection{}.lean(expr, requested)`.
[[nodiscard]] auto lean(const expr::ExprPtr& expr, const FieldSet& requested) -> LeanResult;

}  // namespace tablex::optimize
