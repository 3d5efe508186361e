#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/printer.hpp>
#include <tablex/expr/traversal.hpp>
#include <tablex/optimize/lean_projection.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tablex::optimize {

namespace {

using expr::ExprPtr;
using expr::ExprResult;

auto to_set(const std::vector<std::string>& names) -> FieldSet {
    return FieldSet(names.begin(), names.end());
}

auto intersect(const FieldSet& fields, const std::vector<std::string>& names) -> FieldSet {
    FieldSet out;
    for (const auto& name : names) {
        if (fields.contains(name)) {
            out.insert(name);
        }
    }
    return out;
}

void merge(FieldSet& into, const FieldSet& from) {
    into.insert(from.begin(), from.end());
}

using Seen = robin_hood::unordered_flat_set<const expr::Expr*>;

/// Columns a node reads from its child `source`.
auto direct_reads(const expr::Expr& consumer, const FieldSet& all) -> FieldSet {
    if (const auto* proj = std::get_if<expr::Projection>(&consumer.node)) {
        return to_set(proj->columns);
    }
    if (const auto* col = std::get_if<expr::Column>(&consumer.node)) {
        return FieldSet{col->name};
    }
    if (const auto* cw = std::get_if<expr::ColumnWise>(&consumer.node)) {
        return to_set(expr::active_columns(*cw));
    }
    return all;
}

void collect_reads(const ExprPtr& term, const expr::Expr& source, const FieldSet& all,
                   FieldSet& out, Seen& seen) {
    if (!seen.insert(term.get()).second) {
        return;
    }
    if (expr::structural_equal(*term, source)) {
        merge(out, all);
        return;
    }
    for (const auto& child : expr::children(*term)) {
        if (expr::structural_equal(*child, source)) {
            merge(out, direct_reads(*term, all));
        } else {
            collect_reads(child, source, all, out, seen);
        }
    }
}

}  // namespace

/// One rule per node kind. `requested` is never empty here; `visit` expands
/// an empty request to the node's own columns.
struct LeanProjection::Rules {
    LeanProjection& self;
    const ExprPtr& node;
    const FieldSet& requested;

    auto done(ExprResult rebuilt, FieldSet fields) -> LeanResult {
        auto kept = self.keep(std::move(rebuilt));
        if (!kept.has_value()) {
            return std::unexpected(kept.error());
        }
        return Leaned{.expr = std::move(*kept), .fields = std::move(fields)};
    }

    /// Lean a child for its own full column set.
    auto whole(const ExprPtr& child) -> LeanResult {
        auto names = expr::columns(*child);
        if (!names.has_value()) {
            return std::unexpected(names.error());
        }
        return self.visit(child, to_set(*names));
    }

    auto operator()(const expr::Symbol& sym) -> LeanResult {
        const auto* record = sym.dshape.record();
        for (const auto& name : requested) {
            if (record == nullptr || !record->contains(name)) {
                return fail(ErrorKind::UnknownField,
                            fmt::format("field '{}' not in '{}' of type {}", name, sym.name,
                                        sym.dshape.to_string()));
            }
        }
        std::vector<std::string> columns(requested.begin(), requested.end());
        spdlog::debug("lean_projection: symbol '{}' -> [{}]", sym.name, fmt::join(columns, ", "));
        auto leaf = self.keep(node);
        if (!leaf.has_value()) {
            return std::unexpected(leaf.error());
        }
        return done(expr::projection(std::move(*leaf), std::move(columns)), requested);
    }

    auto operator()(const expr::Projection& proj) -> LeanResult {
        for (const auto& name : requested) {
            if (std::ranges::find(proj.columns, name) == proj.columns.end()) {
                return fail(ErrorKind::UnknownField,
                            fmt::format("field '{}' not in projection '{}'", name,
                                        expr::to_string(*node)));
            }
        }
        const FieldSet& down = requested;
        auto child = self.visit(proj.child, down);
        if (!child.has_value()) {
            return child;
        }
        std::vector<std::string> kept;
        for (const auto& name : proj.columns) {
            if (down.contains(name)) {
                kept.push_back(name);
            }
        }
        auto child_columns = expr::columns(*child->expr);
        if (!child_columns.has_value()) {
            return std::unexpected(child_columns.error());
        }
        if (*child_columns == kept) {
            return Leaned{.expr = std::move(child->expr), .fields = down};
        }
        return done(expr::projection(std::move(child->expr), std::move(kept)), down);
    }

    auto operator()(const expr::Column& col) -> LeanResult {
        FieldSet fields = requested;
        fields.insert(col.name);
        auto child = self.visit(col.child, fields);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::column(std::move(child->expr), col.name), std::move(fields));
    }

    auto operator()(const expr::ColumnWise& cw) -> LeanResult {
        FieldSet fields = requested;
        for (auto& name : expr::active_columns(cw)) {
            fields.insert(std::move(name));
        }
        auto child = self.visit(cw.child, fields);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::broadcast(std::move(child->expr), cw.scalar), std::move(fields));
    }

    auto operator()(const expr::Selection& sel) -> LeanResult {
        auto predicate = self.visit(sel.predicate, {});
        if (!predicate.has_value()) {
            return predicate;
        }
        FieldSet fields = requested;
        merge(fields, predicate->fields);
        auto reads = columns_read(sel.predicate, *sel.child);
        if (!reads.has_value()) {
            return std::unexpected(reads.error());
        }
        merge(fields, *reads);
        auto child = self.visit(sel.child, fields);
        if (!child.has_value()) {
            return child;
        }
        auto rebased = expr::substitute(sel.predicate, *sel.child, child->expr);
        if (!rebased.has_value()) {
            return std::unexpected(rebased.error());
        }
        return done(expr::selection(std::move(child->expr), std::move(*rebased)),
                    std::move(fields));
    }

    auto operator()(const expr::Reduction& red) -> LeanResult {
        auto child = self.visit(red.child, {});
        if (!child.has_value()) {
            return child;
        }
        return done(expr::reduction(red.kind, std::move(child->expr)), std::move(child->fields));
    }

    auto operator()(const expr::Summary& sum) -> LeanResult {
        std::vector<std::pair<std::string, ExprPtr>> entries;
        FieldSet fields;
        for (std::size_t i = 0; i < sum.names.size(); ++i) {
            if (!requested.contains(sum.names[i])) {
                spdlog::debug("lean_projection: summary drops '{}'", sum.names[i]);
                continue;
            }
            auto value = self.visit(sum.values[i], {});
            if (!value.has_value()) {
                return value;
            }
            merge(fields, value->fields);
            entries.emplace_back(sum.names[i], std::move(value->expr));
        }
        return done(expr::summary(std::move(entries)), std::move(fields));
    }

    auto operator()(const expr::By& grouped) -> LeanResult {
        auto grouper_columns = expr::columns(*grouped.grouper);
        if (!grouper_columns.has_value()) {
            return std::unexpected(grouper_columns.error());
        }
        auto apply_columns = expr::columns(*grouped.apply);
        if (!apply_columns.has_value()) {
            return std::unexpected(apply_columns.error());
        }
        auto grouper = self.visit(grouped.grouper, intersect(requested, *grouper_columns));
        if (!grouper.has_value()) {
            return grouper;
        }
        auto apply = self.visit(grouped.apply, intersect(requested, *apply_columns));
        if (!apply.has_value()) {
            return apply;
        }
        FieldSet fields = grouper->fields;
        merge(fields, apply->fields);

        auto ancestor = common_subexpression(grouper->expr, apply->expr);
        if (!ancestor.has_value()) {
            return std::unexpected(ancestor.error());
        }
        // What the rewritten sides read from the shared input, including
        // columns only a nested predicate or sort key needs.
        auto needed = columns_read(grouper->expr, **ancestor);
        if (!needed.has_value()) {
            return std::unexpected(needed.error());
        }
        auto apply_reads = columns_read(apply->expr, **ancestor);
        if (!apply_reads.has_value()) {
            return std::unexpected(apply_reads.error());
        }
        merge(*needed, *apply_reads);

        auto shared = self.narrow(*ancestor, *needed);
        if (!shared.has_value()) {
            return shared;
        }
        ExprPtr new_grouper = grouper->expr;
        ExprPtr new_apply = apply->expr;
        if (shared->expr != *ancestor) {
            spdlog::debug("lean_projection: by shares '{}' -> '{}'", expr::to_string(**ancestor),
                          expr::to_string(*shared->expr));
            auto g = expr::substitute(new_grouper, **ancestor, shared->expr);
            if (!g.has_value()) {
                return std::unexpected(g.error());
            }
            auto a = expr::substitute(new_apply, **ancestor, shared->expr);
            if (!a.has_value()) {
                return std::unexpected(a.error());
            }
            new_grouper = std::move(*g);
            new_apply = std::move(*a);
        }
        return done(expr::by(std::move(shared->expr), std::move(new_grouper), std::move(new_apply)),
                    std::move(fields));
    }

    auto operator()(const expr::Sort& srt) -> LeanResult {
        FieldSet fields = requested;
        const auto* key_expr = std::get_if<ExprPtr>(&srt.key);
        if (const auto* name = std::get_if<std::string>(&srt.key)) {
            fields.insert(*name);
        } else if (const auto* names = std::get_if<std::vector<std::string>>(&srt.key)) {
            fields.insert(names->begin(), names->end());
        } else {
            auto key = self.visit(*key_expr, {});
            if (!key.has_value()) {
                return key;
            }
            merge(fields, key->fields);
            auto reads = columns_read(*key_expr, *srt.child);
            if (!reads.has_value()) {
                return std::unexpected(reads.error());
            }
            merge(fields, *reads);
        }
        auto child = self.visit(srt.child, fields);
        if (!child.has_value()) {
            return child;
        }
        expr::SortKey key = srt.key;
        if (key_expr != nullptr) {
            auto rebased = expr::substitute(*key_expr, *srt.child, child->expr);
            if (!rebased.has_value()) {
                return std::unexpected(rebased.error());
            }
            key = std::move(*rebased);
        }
        return done(expr::sort(std::move(child->expr), std::move(key), srt.ascending),
                    std::move(fields));
    }

    auto operator()(const expr::Distinct& dist) -> LeanResult {
        auto child = whole(dist.child);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::distinct(std::move(child->expr)), std::move(child->fields));
    }

    auto operator()(const expr::Head& hd) -> LeanResult {
        auto child = self.visit(hd.child, requested);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::head(std::move(child->expr), hd.n), std::move(child->fields));
    }

    auto operator()(const expr::Label& lbl) -> LeanResult {
        auto child = whole(lbl.child);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::label(std::move(child->expr), lbl.label), std::move(child->fields));
    }

    auto operator()(const expr::ReLabel& rel) -> LeanResult {
        FieldSet down;
        for (const auto& name : requested) {
            auto it = std::ranges::find_if(rel.labels,
                                           [&](const auto& entry) { return entry.second == name; });
            down.insert(it != rel.labels.end() ? it->first : name);
        }
        auto child = self.visit(rel.child, down);
        if (!child.has_value()) {
            return child;
        }
        auto child_columns = expr::columns(*child->expr);
        if (!child_columns.has_value()) {
            return std::unexpected(child_columns.error());
        }
        std::vector<std::pair<std::string, std::string>> labels;
        for (const auto& entry : rel.labels) {
            if (std::ranges::find(*child_columns, entry.first) != child_columns->end()) {
                labels.push_back(entry);
            }
        }
        return done(expr::relabel(std::move(child->expr), std::move(labels)),
                    std::move(child->fields));
    }

    auto operator()(const expr::Map& mp) -> LeanResult {
        auto child = whole(mp.child);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::map(std::move(child->expr), mp.func, mp.schema),
                    std::move(child->fields));
    }

    auto operator()(const expr::Apply& ap) -> LeanResult {
        auto child = whole(ap.child);
        if (!child.has_value()) {
            return child;
        }
        return done(expr::apply(std::move(child->expr), ap.func, ap.dshape),
                    std::move(child->fields));
    }

    auto operator()(const expr::Join& jn) -> LeanResult {
        auto left_columns = expr::columns(*jn.lhs);
        if (!left_columns.has_value()) {
            return std::unexpected(left_columns.error());
        }
        auto right_columns = expr::columns(*jn.rhs);
        if (!right_columns.has_value()) {
            return std::unexpected(right_columns.error());
        }
        FieldSet left{jn.on_left};
        FieldSet right{jn.on_right};
        for (const auto& name : requested) {
            if (std::ranges::find(*left_columns, name) != left_columns->end()) {
                left.insert(name);
            } else if (std::ranges::find(*right_columns, name) != right_columns->end()) {
                right.insert(name);
            } else {
                return fail(ErrorKind::UnknownField,
                            fmt::format("field '{}' on neither side of '{}'", name,
                                        expr::to_string(*node)));
            }
        }
        auto lhs = self.visit(jn.lhs, left);
        if (!lhs.has_value()) {
            return lhs;
        }
        auto rhs = self.visit(jn.rhs, right);
        if (!rhs.has_value()) {
            return rhs;
        }
        FieldSet fields = lhs->fields;
        merge(fields, rhs->fields);
        return done(expr::join(std::move(lhs->expr), std::move(rhs->expr), jn.on_left, jn.on_right),
                    std::move(fields));
    }
};

LeanProjection::LeanProjection() : LeanProjection(Config{}) {}

LeanProjection::LeanProjection(Config config) : config_(config) {}

auto LeanProjection::run(const ExprPtr& root) -> ExprResult {
    auto original = expr::columns(*root);
    if (!original.has_value()) {
        return std::unexpected(original.error());
    }
    auto leaned = lean(root, to_set(*original));
    if (!leaned.has_value()) {
        return std::unexpected(leaned.error());
    }
    ExprPtr result = std::move(leaned->expr);
    if (config_.restore_column_order) {
        auto now = expr::columns(*result);
        if (!now.has_value()) {
            return std::unexpected(now.error());
        }
        if (*now != *original) {
            auto restored = keep(expr::projection(result, *original));
            if (!restored.has_value()) {
                return restored;
            }
            result = std::move(*restored);
        }
    }
    spdlog::debug("lean_projection: {} => {}", expr::to_string(*root), expr::to_string(*result));
    return result;
}

auto LeanProjection::lean(const ExprPtr& root, const FieldSet& requested) -> LeanResult {
    auto available = expr::columns(*root);
    if (!available.has_value()) {
        return std::unexpected(available.error());
    }
    for (const auto& name : requested) {
        if (std::ranges::find(*available, name) == available->end()) {
            return fail(ErrorKind::UnknownField,
                        fmt::format("field '{}' not in output of '{}'", name,
                                    expr::to_string(*root)));
        }
    }
    return visit(root, requested);
}

auto LeanProjection::visit(const ExprPtr& root, const FieldSet& requested) -> LeanResult {
    FieldSet fields = requested;
    if (fields.empty()) {
        auto own = expr::columns(*root);
        if (!own.has_value()) {
            return std::unexpected(own.error());
        }
        fields = to_set(*own);
    }
    spdlog::trace("lean_projection: {} [{}]", expr::kind_name(root->kind()),
                  fmt::join(fields, ", "));
    return std::visit(Rules{.self = *this, .node = root, .requested = fields}, root->node);
}

auto LeanProjection::keep(ExprResult rebuilt) -> ExprResult {
    if (!rebuilt.has_value() || !config_.intern) {
        return rebuilt;
    }
    return interner_.intern(*rebuilt);
}

auto LeanProjection::narrow(const ExprPtr& shared, const FieldSet& needed) -> LeanResult {
    auto exposed = expr::columns(*shared);
    if (!exposed.has_value()) {
        return std::unexpected(exposed.error());
    }
    auto exposed_set = to_set(*exposed);
    if (!std::ranges::includes(exposed_set, needed)) {
        return fail(ErrorKind::InternalConsistency,
                    fmt::format("shared input '{}' lacks fields of [{}]", expr::to_string(*shared),
                                fmt::join(needed, ", ")));
    }
    if (needed.empty() || needed.size() == exposed_set.size()) {
        return Leaned{.expr = shared, .fields = std::move(exposed_set)};
    }
    return visit(shared, needed);
}

auto columns_read(const ExprPtr& term, const expr::Expr& source)
    -> std::expected<FieldSet, Error> {
    auto exposed = expr::columns(source);
    if (!exposed.has_value()) {
        return std::unexpected(exposed.error());
    }
    auto all = to_set(*exposed);
    FieldSet out;
    Seen seen;
    collect_reads(term, source, all, out, seen);
    return out;
}

auto lean_projection(const ExprPtr& root) -> ExprResult {
    LeanProjection optimizer;
    return optimizer.run(root);
}

auto lean(const ExprPtr& root, const FieldSet& requested) -> LeanResult {
    LeanProjection optimizer;
    return optimizer.lean(root, requested);
}

}  // namespace tablex::optimize
