#include <tablex/expr/builder.hpp>
#include <tablex/expr/traversal.hpp>

#include <fmt/core.h>
#include <robin_hood.h>

#include <type_traits>

namespace tablex::expr {

namespace {

using SeenSet = robin_hood::unordered_flat_set<ExprPtr, StructuralHash, StructuralEq>;

void collect(const ExprPtr& expr, SeenSet& seen, std::vector<ExprPtr>& out) {
    if (!seen.insert(expr).second) {
        return;
    }
    out.push_back(expr);
    for (const auto& child : children(*expr)) {
        collect(child, seen, out);
    }
}

/// Rebuild one node from replacement children through the validating
/// factories.
struct Rebuild {
    std::vector<ExprPtr>& kids;

    auto operator()(const Symbol& node) const -> ExprResult {
        return expr::symbol(node.name, node.dshape);
    }
    auto operator()(const Projection& node) const -> ExprResult {
        return expr::projection(kids[0], node.columns);
    }
    auto operator()(const Column& node) const -> ExprResult {
        return expr::column(kids[0], node.name);
    }
    auto operator()(const Selection& /*node*/) const -> ExprResult {
        return expr::selection(kids[0], kids[1]);
    }
    auto operator()(const ColumnWise& node) const -> ExprResult {
        return expr::broadcast(kids[0], node.scalar);
    }
    auto operator()(const Reduction& node) const -> ExprResult {
        return expr::reduction(node.kind, kids[0]);
    }
    auto operator()(const Summary& node) const -> ExprResult {
        std::vector<std::pair<std::string, ExprPtr>> entries;
        entries.reserve(node.names.size());
        for (std::size_t i = 0; i < node.names.size(); ++i) {
            entries.emplace_back(node.names[i], kids[i]);
        }
        return expr::summary(std::move(entries));
    }
    auto operator()(const By& /*node*/) const -> ExprResult {
        return expr::by(kids[0], kids[1], kids[2]);
    }
    auto operator()(const Sort& node) const -> ExprResult {
        if (std::holds_alternative<ExprPtr>(node.key)) {
            return expr::sort(kids[0], kids[1], node.ascending);
        }
        return expr::sort(kids[0], node.key, node.ascending);
    }
    auto operator()(const Distinct& /*node*/) const -> ExprResult {
        return expr::distinct(kids[0]);
    }
    auto operator()(const Head& node) const -> ExprResult { return expr::head(kids[0], node.n); }
    auto operator()(const Label& node) const -> ExprResult {
        return expr::label(kids[0], node.label);
    }
    auto operator()(const ReLabel& node) const -> ExprResult {
        return expr::relabel(kids[0], node.labels);
    }
    auto operator()(const Map& node) const -> ExprResult {
        return expr::map(kids[0], node.func, node.schema);
    }
    auto operator()(const Apply& node) const -> ExprResult {
        return expr::apply(kids[0], node.func, node.dshape);
    }
    auto operator()(const Join& node) const -> ExprResult {
        return expr::join(kids[0], kids[1], node.on_left, node.on_right);
    }
};

}  // namespace

auto children(const Expr& expr) -> std::vector<ExprPtr> {
    return std::visit(
        [](const auto& node) -> std::vector<ExprPtr> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, Symbol>) {
                return {};
            } else if constexpr (std::is_same_v<T, Selection>) {
                return {node.child, node.predicate};
            } else if constexpr (std::is_same_v<T, Summary>) {
                return node.values;
            } else if constexpr (std::is_same_v<T, By>) {
                return {node.parent, node.grouper, node.apply};
            } else if constexpr (std::is_same_v<T, Sort>) {
                if (const auto* key = std::get_if<ExprPtr>(&node.key)) {
                    return {node.child, *key};
                }
                return {node.child};
            } else if constexpr (std::is_same_v<T, Join>) {
                return {node.lhs, node.rhs};
            } else {
                return {node.child};
            }
        },
        expr.node);
}

auto subterms(const ExprPtr& expr) -> std::vector<ExprPtr> {
    SeenSet seen;
    std::vector<ExprPtr> out;
    collect(expr, seen, out);
    return out;
}

auto contains(const ExprPtr& haystack, const Expr& needle) -> bool {
    if (structural_equal(*haystack, needle)) {
        return true;
    }
    for (const auto& child : children(*haystack)) {
        if (contains(child, needle)) {
            return true;
        }
    }
    return false;
}

auto leaves(const ExprPtr& expr) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> out;
    for (auto& term : subterms(expr)) {
        if (term->kind() == ExprKind::Symbol) {
            out.push_back(std::move(term));
        }
    }
    return out;
}

auto node_count(const Expr& expr) -> std::size_t {
    std::size_t count = 1;
    for (const auto& child : children(expr)) {
        count += node_count(*child);
    }
    return count;
}

auto with_children(const ExprPtr& expr, std::vector<ExprPtr> replacement) -> ExprResult {
    auto expected = children(*expr).size();
    if (replacement.size() != expected) {
        return fail(ErrorKind::InvalidArgument,
                    fmt::format("{} takes {} children, got {}", kind_name(expr->kind()), expected,
                                replacement.size()));
    }
    return std::visit(Rebuild{.kids = replacement}, expr->node);
}

auto substitute(const ExprPtr& expr, const Expr& from, const ExprPtr& to) -> ExprResult {
    if (structural_equal(*expr, from)) {
        return to;
    }
    auto kids = children(*expr);
    bool changed = false;
    for (auto& kid : kids) {
        auto next = substitute(kid, from, to);
        if (!next.has_value()) {
            return next;
        }
        if (*next != kid) {
            changed = true;
            kid = std::move(*next);
        }
    }
    if (!changed) {
        return expr;
    }
    return with_children(expr, std::move(kids));
}

}  // namespace tablex::expr
