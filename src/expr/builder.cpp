#include <tablex/expr/builder.hpp>
#include <tablex/expr/printer.hpp>
#include <tablex/expr/traversal.hpp>
#include <tablex/types/parser.hpp>

#include <fmt/core.h>

#include <unordered_set>

namespace tablex::expr {

namespace {

auto make(Expr expr) -> ExprPtr {
    // Children already carry their hashes, so this only hashes the node's own fields.
    expr.hash = structural_hash(expr);
    return std::make_shared<const Expr>(std::move(expr));
}

auto require_child(const ExprPtr& child, std::string_view what) -> std::expected<void, Error> {
    if (!child) {
        return fail(ErrorKind::InvalidArgument, fmt::format("{} needs a child expression", what));
    }
    return {};
}

/// Infer the new node's shape once, so a node is only returned when its
/// schema is well defined.
auto checked(ExprPtr node) -> ExprResult {
    auto shape = dshape(*node);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    return node;
}

auto require_columns(const Expr& child, const std::vector<std::string>& names)
    -> std::expected<void, Error> {
    auto record = schema(child);
    if (!record.has_value()) {
        return std::unexpected(record.error());
    }
    for (const auto& name : names) {
        if (!record->contains(name)) {
            return fail(ErrorKind::UnknownColumn,
                        fmt::format("column '{}' not in {}", name, record->to_string()));
        }
    }
    return {};
}

auto require_tabular(const Expr& expr, std::string_view what) -> std::expected<void, Error> {
    auto tabular = is_tabular(expr);
    if (!tabular.has_value()) {
        return std::unexpected(tabular.error());
    }
    if (!*tabular) {
        return fail(ErrorKind::InvalidArgument, fmt::format("{} expects a table", what));
    }
    return {};
}

/// `expr` must read its rows from `source`: a predicate or sort key over
/// another table, or over a wider table that `source` projects, is rejected.
auto require_built_on(const ExprPtr& expr, const ExprPtr& source, std::string_view what)
    -> std::expected<void, Error> {
    if (!contains(expr, *source)) {
        return fail(ErrorKind::MismatchedSourceTable,
                    fmt::format("{} '{}' is not built on '{}'", what, to_string(*expr),
                                to_string(*source)));
    }
    return {};
}

}  // namespace

auto symbol(std::string name, types::DataShape dshape) -> ExprResult {
    if (!dshape.is_tabular()) {
        return fail(ErrorKind::InvalidArgument,
                    fmt::format("symbol '{}' needs a tabular datashape, got '{}'", name,
                                dshape.to_string()));
    }
    if (dshape.record() == nullptr) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("symbol '{}' needs a record measure, got '{}'", name,
                                dshape.to_string()));
    }
    return make(Expr{.node = Symbol{.name = std::move(name), .dshape = std::move(dshape)}});
}

auto symbol(std::string name, std::string_view dshape_text) -> ExprResult {
    auto shape = types::parse_dshape(dshape_text);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    return symbol(std::move(name), std::move(*shape));
}

auto projection(ExprPtr child, std::vector<std::string> columns) -> ExprResult {
    if (auto ok = require_child(child, "projection"); !ok) {
        return std::unexpected(ok.error());
    }
    if (columns.empty()) {
        return fail(ErrorKind::InvalidArgument, "projection needs at least one column");
    }
    std::unordered_set<std::string_view> seen;
    for (const auto& name : columns) {
        if (!seen.insert(name).second) {
            return fail(ErrorKind::DuplicateField,
                        fmt::format("column '{}' projected more than once", name));
        }
    }
    if (auto ok = require_columns(*child, columns); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(
        make(Expr{.node = Projection{.child = std::move(child), .columns = std::move(columns)}}));
}

auto column(ExprPtr child, std::string name) -> ExprResult {
    if (auto ok = require_child(child, "column"); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_columns(*child, {name}); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(make(Expr{.node = Column{.child = std::move(child), .name = std::move(name)}}));
}

auto selection(ExprPtr child, ExprPtr predicate) -> ExprResult {
    if (auto ok = require_child(child, "selection"); !ok) {
        return std::unexpected(ok.error());
    }
    if (!predicate) {
        return fail(ErrorKind::InvalidArgument, "selection needs a predicate");
    }
    auto shape = dshape(*predicate);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    const auto* record = shape->record();
    if (!shape->is_tabular() || record == nullptr || record->size() != 1 ||
        record->fields().front().type != types::Primitive::Bool) {
        return fail(ErrorKind::NonBooleanPredicate,
                    fmt::format("must select over a boolean predicate, got '{}'",
                                shape->to_string()));
    }
    if (auto ok = require_built_on(predicate, child, "selection predicate"); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(
        make(Expr{.node = Selection{
                      .child = std::move(child),
                      .predicate = std::move(predicate),
                  }}));
}

auto broadcast(ExprPtr child, ScalarPtr scalar) -> ExprResult {
    if (auto ok = require_child(child, "broadcast"); !ok) {
        return std::unexpected(ok.error());
    }
    if (!scalar) {
        return fail(ErrorKind::InvalidArgument, "broadcast needs a scalar expression");
    }
    auto record = schema(*child);
    if (!record.has_value()) {
        return std::unexpected(record.error());
    }
    std::vector<const ScalarSymbol*> placeholders;
    std::function<void(const ScalarExpr&)> walk = [&](const ScalarExpr& e) {
        if (const auto* sym = std::get_if<ScalarSymbol>(&e.node)) {
            placeholders.push_back(sym);
        } else if (const auto* unary = std::get_if<ScalarUnary>(&e.node)) {
            walk(*unary->operand);
        } else if (const auto* binary = std::get_if<ScalarBinary>(&e.node)) {
            walk(*binary->left);
            walk(*binary->right);
        }
    };
    walk(*scalar);
    if (placeholders.empty()) {
        return fail(ErrorKind::InvalidArgument, "broadcast references no column");
    }
    for (const auto* sym : placeholders) {
        const auto* field = record->find(sym->name);
        if (field == nullptr) {
            return fail(ErrorKind::UnknownColumn,
                        fmt::format("column '{}' not in {}", sym->name, record->to_string()));
        }
        if (field->type != sym->type) {
            return fail(ErrorKind::TypeMismatch,
                        fmt::format("placeholder '{}' is {} but the column is {}", sym->name,
                                    types::to_string(sym->type), types::to_string(field->type)));
        }
    }
    return checked(
        make(Expr{.node = ColumnWise{.child = std::move(child), .scalar = std::move(scalar)}}));
}

auto reduction(ReductionKind kind, ExprPtr child) -> ExprResult {
    if (auto ok = require_child(child, reduction_name(kind)); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(make(Expr{.node = Reduction{.kind = kind, .child = std::move(child)}}));
}

auto summary(std::vector<std::pair<std::string, ExprPtr>> entries) -> ExprResult {
    Summary node;
    node.names.reserve(entries.size());
    node.values.reserve(entries.size());
    for (auto& [name, value] : entries) {
        if (auto ok = require_child(value, "summary"); !ok) {
            return std::unexpected(ok.error());
        }
        auto tabular = is_tabular(*value);
        if (!tabular.has_value()) {
            return std::unexpected(tabular.error());
        }
        if (*tabular) {
            return fail(ErrorKind::InvalidArgument,
                        fmt::format("summary entry '{}' does not reduce", name));
        }
        node.names.push_back(std::move(name));
        node.values.push_back(std::move(value));
    }
    return checked(make(Expr{.node = std::move(node)}));
}

auto by(ExprPtr parent, ExprPtr grouper, ExprPtr apply) -> ExprResult {
    if (!parent || !grouper || !apply) {
        return fail(ErrorKind::InvalidArgument, "by needs parent, grouper and apply");
    }
    if (auto ok = require_tabular(*grouper, "by grouper"); !ok) {
        return std::unexpected(ok.error());
    }
    auto reduces = is_tabular(*apply);
    if (!reduces.has_value()) {
        return std::unexpected(reduces.error());
    }
    if (*reduces) {
        return fail(ErrorKind::NonReducingApply,
                    "expected a reduction as the apply of by, got a row-producing expression");
    }
    if (!contains(grouper, *parent) || !contains(apply, *parent)) {
        return fail(ErrorKind::InvalidArgument,
                    "grouper and apply of by must both be built from its parent");
    }
    return checked(make(Expr{.node = By{
                                 .parent = std::move(parent),
                                 .grouper = std::move(grouper),
                                 .apply = std::move(apply),
                             }}));
}

auto sort(ExprPtr child, SortKey key, bool ascending) -> ExprResult {
    if (auto ok = require_child(child, "sort"); !ok) {
        return std::unexpected(ok.error());
    }
    if (const auto* name = std::get_if<std::string>(&key)) {
        if (auto ok = require_columns(*child, {*name}); !ok) {
            return std::unexpected(ok.error());
        }
    } else if (const auto* names = std::get_if<std::vector<std::string>>(&key)) {
        if (names->empty()) {
            return fail(ErrorKind::InvalidArgument, "sort needs at least one key column");
        }
        if (auto ok = require_columns(*child, *names); !ok) {
            return std::unexpected(ok.error());
        }
    } else {
        const auto& key_expr = std::get<ExprPtr>(key);
        if (!key_expr) {
            return fail(ErrorKind::InvalidArgument, "sort key expression is empty");
        }
        if (auto ok = require_tabular(*key_expr, "sort key"); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = require_built_on(key_expr, child, "sort key"); !ok) {
            return std::unexpected(ok.error());
        }
    }
    return checked(make(Expr{.node = Sort{
                                 .child = std::move(child),
                                 .key = std::move(key),
                                 .ascending = ascending,
                             }}));
}

auto distinct(ExprPtr child) -> ExprResult {
    if (auto ok = require_child(child, "distinct"); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(make(Expr{.node = Distinct{.child = std::move(child)}}));
}

auto head(ExprPtr child, std::size_t n) -> ExprResult {
    if (auto ok = require_child(child, "head"); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = require_tabular(*child, "head"); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(make(Expr{.node = Head{.child = std::move(child), .n = n}}));
}

auto label(ExprPtr child, std::string label) -> ExprResult {
    if (auto ok = require_child(child, "label"); !ok) {
        return std::unexpected(ok.error());
    }
    return make(Expr{.node = Label{.child = std::move(child), .label = std::move(label)}});
}

auto relabel(ExprPtr child, std::vector<std::pair<std::string, std::string>> labels)
    -> ExprResult {
    if (auto ok = require_child(child, "relabel"); !ok) {
        return std::unexpected(ok.error());
    }
    std::vector<std::string> keys;
    keys.reserve(labels.size());
    for (const auto& [from, to] : labels) {
        keys.push_back(from);
    }
    if (auto ok = require_columns(*child, keys); !ok) {
        return std::unexpected(ok.error());
    }
    return checked(
        make(Expr{.node = ReLabel{.child = std::move(child), .labels = std::move(labels)}}));
}

auto map(ExprPtr child, std::string func, std::optional<types::Record> schema) -> ExprResult {
    if (auto ok = require_child(child, "map"); !ok) {
        return std::unexpected(ok.error());
    }
    return make(Expr{.node = Map{
                         .child = std::move(child),
                         .func = std::move(func),
                         .schema = std::move(schema),
                     }});
}

auto apply(ExprPtr child, std::string func, std::optional<types::DataShape> declared)
    -> ExprResult {
    if (auto ok = require_child(child, "apply"); !ok) {
        return std::unexpected(ok.error());
    }
    return make(Expr{.node = Apply{
                         .child = std::move(child),
                         .func = std::move(func),
                         .dshape = std::move(declared),
                     }});
}

auto join(ExprPtr lhs, ExprPtr rhs, std::string on_left, std::string on_right) -> ExprResult {
    if (!lhs || !rhs) {
        return fail(ErrorKind::InvalidArgument, "join needs two inputs");
    }
    if (on_right.empty()) {
        on_right = on_left;
    }
    auto left = schema(*lhs);
    if (!left.has_value()) {
        return std::unexpected(left.error());
    }
    auto right = schema(*rhs);
    if (!right.has_value()) {
        return std::unexpected(right.error());
    }
    const auto* left_key = left->find(on_left);
    if (left_key == nullptr) {
        return fail(ErrorKind::UnknownColumn,
                    fmt::format("join key '{}' not in {}", on_left, left->to_string()));
    }
    const auto* right_key = right->find(on_right);
    if (right_key == nullptr) {
        return fail(ErrorKind::UnknownColumn,
                    fmt::format("join key '{}' not in {}", on_right, right->to_string()));
    }
    if (left_key->type != right_key->type) {
        return fail(ErrorKind::JoinKeyMismatch,
                    fmt::format("join keys differ in type: {} {} vs {} {}", on_left,
                                types::to_string(left_key->type), on_right,
                                types::to_string(right_key->type)));
    }
    return checked(make(Expr{.node = Join{
                                 .lhs = std::move(lhs),
                                 .rhs = std::move(rhs),
                                 .on_left = std::move(on_left),
                                 .on_right = std::move(on_right),
                             }}));
}

}  // namespace tablex::expr
