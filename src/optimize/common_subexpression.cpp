#include <tablex/expr/printer.hpp>
#include <tablex/expr/traversal.hpp>
#include <tablex/optimize/common_subexpression.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace tablex::optimize {

namespace {

using SizeMemo = robin_hood::unordered_flat_map<const expr::Expr*, std::size_t>;

/// `expr::node_count`, remembering every subtree it has already counted.
auto subtree_size(const expr::Expr& node, SizeMemo& memo) -> std::size_t {
    if (auto it = memo.find(&node); it != memo.end()) {
        return it->second;
    }
    std::size_t size = 1;
    for (const auto& child : expr::children(node)) {
        size += subtree_size(*child, memo);
    }
    memo.emplace(&node, size);
    return size;
}

}  // namespace

auto common_subexpression(const expr::ExprPtr& lhs, const expr::ExprPtr& rhs)
    -> expr::ExprResult {
    if (!lhs || !rhs) {
        return fail(ErrorKind::InvalidArgument, "common_subexpression needs two expressions");
    }
    robin_hood::unordered_flat_set<expr::ExprPtr, expr::StructuralHash, expr::StructuralEq> right;
    for (auto& term : expr::subterms(rhs)) {
        right.insert(std::move(term));
    }

    SizeMemo sizes;
    expr::ExprPtr best;
    std::size_t best_size = 0;
    std::optional<std::string> best_text;  // rendered only to break ties
    for (const auto& term : expr::subterms(lhs)) {
        if (right.count(term) == 0) {
            continue;
        }
        auto size = subtree_size(*term, sizes);
        if (size < best_size) {
            continue;
        }
        if (size > best_size) {
            best = term;
            best_size = size;
            best_text.reset();
            continue;
        }
        if (!best_text) {
            best_text = expr::to_string(*best);
        }
        auto text = expr::to_string(*term);
        if (text < *best_text) {
            best = term;
            best_text = std::move(text);
        }
    }
    if (!best) {
        return fail(ErrorKind::NoCommonAncestor,
                    fmt::format("'{}' and '{}' share no sub-expression", expr::to_string(*lhs),
                                expr::to_string(*rhs)));
    }
    if (spdlog::get_level() <= spdlog::level::trace) {
        spdlog::trace("common_subexpression: {} ({} nodes)", expr::to_string(*best), best_size);
    }
    return best;
}

auto Interner::intern(const expr::ExprPtr& expr) -> expr::ExprPtr {
    return *nodes_.insert(expr).first;
}

}  // namespace tablex::optimize
