#pragma once

#include <tablex/expr/node.hpp>

#include <robin_hood.h>

#include <cstddef>

namespace tablex::optimize {

/// The sub-expression shared by `lhs` and `rhs` that lies closest to their
/// roots: among nodes present (structurally) in both trees, the one with the
/// largest subtree. Ties go to the smaller rendering. Fails with
/// `NoCommonAncestor` when the trees share nothing.
[[nodiscard]] auto common_subexpression(const expr::ExprPtr& lhs, const expr::ExprPtr& rhs)
    -> expr::ExprResult;

/// Arena of canonical nodes keyed by structure.
///
/// `intern` returns the first node seen with the same structure, so two
/// interned nodes are structurally equal exactly when they are the same
/// pointer. Callers intern bottom-up; children of a node passed in should
/// already be canonical.
class Interner {
   public:
    [[nodiscard]] auto intern(const expr::ExprPtr& expr) -> expr::ExprPtr;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_.size(); }

   private:
    robin_hood::unordered_flat_set<expr::ExprPtr, expr::StructuralHash, expr::StructuralEq> nodes_;
};

}  // namespace tablex::optimize
