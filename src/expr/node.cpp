#include <tablex/core/hash.hpp>
#include <tablex/expr/node.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>
#include <unordered_map>

namespace tablex::expr {

namespace {

using types::DataShape;
using types::Field;
using types::Primitive;
using types::Record;

using ShapeResult = std::expected<DataShape, Error>;

auto record_of(const DataShape& shape) -> std::expected<Record, Error> {
    const auto* record = shape.record();
    if (record == nullptr) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("expected a record datashape, got '{}'", shape.to_string()));
    }
    return *record;
}

auto reduced_type(ReductionKind kind, Primitive input) -> Primitive {
    switch (kind) {
        case ReductionKind::Count:
        case ReductionKind::NUnique:
            return Primitive::Int64;
        case ReductionKind::Mean:
        case ReductionKind::Var:
        case ReductionKind::Std:
            return Primitive::Float64;
        case ReductionKind::Any:
        case ReductionKind::All:
            return Primitive::Bool;
        case ReductionKind::Sum:
        case ReductionKind::Min:
        case ReductionKind::Max:
            return input;
    }
    return input;
}

auto single_field(const Record& record, std::string_view what) -> std::expected<Field, Error> {
    if (record.size() != 1) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("{} expects a single-field input, got {}", what,
                                record.to_string()));
    }
    return record.fields().front();
}

/// Shape inference, one overload per node kind.
struct ShapeOf {
    auto operator()(const Symbol& node) const -> ShapeResult { return node.dshape; }

    auto operator()(const Projection& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        auto record = record_of(*child);
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        auto restricted = record->restrict(node.columns);
        if (!restricted.has_value()) {
            return std::unexpected(restricted.error());
        }
        return DataShape(child->dim(), std::move(*restricted));
    }

    auto operator()(const Column& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        auto record = record_of(*child);
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        auto restricted = record->restrict({node.name});
        if (!restricted.has_value()) {
            return std::unexpected(restricted.error());
        }
        return DataShape(child->dim(), std::move(*restricted));
    }

    auto operator()(const Selection& node) const -> ShapeResult { return dshape(*node.child); }

    auto operator()(const ColumnWise& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        auto type = expr::dtype(*node.scalar);
        if (!type.has_value()) {
            return std::unexpected(type.error());
        }
        const auto* first = first_symbol(*node.scalar);
        if (first == nullptr) {
            return fail(ErrorKind::InvalidArgument, "broadcast references no column");
        }
        auto record = Record::make({Field{.name = first->name, .type = *type}});
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        return DataShape(child->dim(), std::move(*record));
    }

    auto operator()(const Reduction& node) const -> ShapeResult {
        auto child = schema(*node.child);
        if (!child.has_value()) {
            return std::unexpected(child.error());
        }
        auto field = single_field(*child, reduction_name(node.kind));
        if (!field.has_value()) {
            return std::unexpected(field.error());
        }
        auto record = Record::make(
            {Field{.name = field->name, .type = reduced_type(node.kind, field->type)}});
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        return DataShape::value(std::move(*record));
    }

    auto operator()(const Summary& node) const -> ShapeResult {
        std::vector<Field> fields;
        fields.reserve(node.names.size());
        for (std::size_t i = 0; i < node.names.size(); ++i) {
            auto value = schema(*node.values[i]);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            auto field = single_field(*value, "summary");
            if (!field.has_value()) {
                return std::unexpected(field.error());
            }
            fields.push_back(Field{.name = node.names[i], .type = field->type});
        }
        auto record = Record::make(std::move(fields));
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        return DataShape::value(std::move(*record));
    }

    auto operator()(const By& node) const -> ShapeResult {
        auto group = schema(*node.grouper);
        if (!group.has_value()) {
            return std::unexpected(group.error());
        }
        auto applied = schema(*node.apply);
        if (!applied.has_value()) {
            return std::unexpected(applied.error());
        }
        // Grouper fields first; an apply field with a grouper's name is dropped.
        std::vector<Field> fields = group->fields();
        for (const auto& field : applied->fields()) {
            if (!group->contains(field.name)) {
                fields.push_back(field);
            }
        }
        auto record = Record::make(std::move(fields));
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        return DataShape::table(std::move(*record));
    }

    auto operator()(const Sort& node) const -> ShapeResult { return dshape(*node.child); }

    auto operator()(const Distinct& node) const -> ShapeResult { return dshape(*node.child); }

    auto operator()(const Head& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        if (!child->is_tabular()) {
            return fail(ErrorKind::TypeMismatch,
                        fmt::format("head expects a table, got '{}'", child->to_string()));
        }
        return child->with_dim(types::Dimension{.length = node.n});
    }

    auto operator()(const Label& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        auto record = record_of(*child);
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        auto field = single_field(*record, "label");
        if (!field.has_value()) {
            return std::unexpected(field.error());
        }
        auto labelled = Record::make({Field{.name = node.label, .type = field->type}});
        if (!labelled.has_value()) {
            return std::unexpected(labelled.error());
        }
        return DataShape(child->dim(), std::move(*labelled));
    }

    auto operator()(const ReLabel& node) const -> ShapeResult {
        auto child = dshape(*node.child);
        if (!child.has_value()) {
            return child;
        }
        auto record = record_of(*child);
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        std::unordered_map<std::string_view, std::string_view> subs;
        for (const auto& [from, to] : node.labels) {
            subs.emplace(from, to);
        }
        std::vector<Field> fields;
        fields.reserve(record->size());
        for (const auto& field : record->fields()) {
            auto it = subs.find(field.name);
            fields.push_back(Field{
                .name = it == subs.end() ? field.name : std::string(it->second),
                .type = field.type,
            });
        }
        auto renamed = Record::make(std::move(fields));
        if (!renamed.has_value()) {
            return std::unexpected(renamed.error());
        }
        return DataShape(child->dim(), std::move(*renamed));
    }

    auto operator()(const Map& node) const -> ShapeResult {
        if (!node.schema.has_value()) {
            return fail(ErrorKind::UndefinedShape,
                        fmt::format("schema of map('{}') was not declared", node.func));
        }
        return DataShape::table(*node.schema);
    }

    auto operator()(const Apply& node) const -> ShapeResult {
        if (!node.dshape.has_value()) {
            return fail(ErrorKind::UndefinedShape,
                        fmt::format("datashape of apply('{}') was not declared", node.func));
        }
        return *node.dshape;
    }

    auto operator()(const Join& node) const -> ShapeResult {
        auto lhs = schema(*node.lhs);
        if (!lhs.has_value()) {
            return std::unexpected(lhs.error());
        }
        auto rhs = schema(*node.rhs);
        if (!rhs.has_value()) {
            return std::unexpected(rhs.error());
        }
        std::vector<Field> fields = lhs->fields();
        for (const auto& field : rhs->fields()) {
            if (field.name != node.on_right) {
                fields.push_back(field);
            }
        }
        auto record = Record::make(std::move(fields));
        if (!record.has_value()) {
            return std::unexpected(record.error());
        }
        return DataShape::table(std::move(*record));
    }
};

auto sort_key_equal(const SortKey& lhs, const SortKey& rhs) -> bool {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (const auto* l = std::get_if<ExprPtr>(&lhs)) {
        return structural_equal(**l, *std::get<ExprPtr>(rhs));
    }
    return lhs == rhs;
}

/// Field-wise comparison of two nodes of the same kind.
struct SameNode {
    auto operator()(const Symbol& l, const Symbol& r) const -> bool {
        return l.name == r.name && l.dshape == r.dshape;
    }
    auto operator()(const Projection& l, const Projection& r) const -> bool {
        return l.columns == r.columns && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Column& l, const Column& r) const -> bool {
        return l.name == r.name && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Selection& l, const Selection& r) const -> bool {
        return structural_equal(*l.child, *r.child) &&
               structural_equal(*l.predicate, *r.predicate);
    }
    auto operator()(const ColumnWise& l, const ColumnWise& r) const -> bool {
        return scalar_equal(*l.scalar, *r.scalar) && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Reduction& l, const Reduction& r) const -> bool {
        return l.kind == r.kind && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Summary& l, const Summary& r) const -> bool {
        if (l.names != r.names || l.values.size() != r.values.size()) {
            return false;
        }
        for (std::size_t i = 0; i < l.values.size(); ++i) {
            if (!structural_equal(*l.values[i], *r.values[i])) {
                return false;
            }
        }
        return true;
    }
    auto operator()(const By& l, const By& r) const -> bool {
        return structural_equal(*l.grouper, *r.grouper) &&
               structural_equal(*l.apply, *r.apply) && structural_equal(*l.parent, *r.parent);
    }
    auto operator()(const Sort& l, const Sort& r) const -> bool {
        return l.ascending == r.ascending && sort_key_equal(l.key, r.key) &&
               structural_equal(*l.child, *r.child);
    }
    auto operator()(const Distinct& l, const Distinct& r) const -> bool {
        return structural_equal(*l.child, *r.child);
    }
    auto operator()(const Head& l, const Head& r) const -> bool {
        return l.n == r.n && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Label& l, const Label& r) const -> bool {
        return l.label == r.label && structural_equal(*l.child, *r.child);
    }
    auto operator()(const ReLabel& l, const ReLabel& r) const -> bool {
        return l.labels == r.labels && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Map& l, const Map& r) const -> bool {
        return l.func == r.func && l.schema == r.schema &&
               structural_equal(*l.child, *r.child);
    }
    auto operator()(const Apply& l, const Apply& r) const -> bool {
        return l.func == r.func && l.dshape == r.dshape && structural_equal(*l.child, *r.child);
    }
    auto operator()(const Join& l, const Join& r) const -> bool {
        return l.on_left == r.on_left && l.on_right == r.on_right &&
               structural_equal(*l.lhs, *r.lhs) && structural_equal(*l.rhs, *r.rhs);
    }
};

auto hash_string(std::string_view text) -> std::size_t {
    return std::hash<std::string_view>{}(text);
}

struct HashOf {
    std::size_t& seed;

    void operator()(const Symbol& node) const {
        hash_combine(seed, hash_string(node.name));
        hash_combine(seed, hash_string(node.dshape.to_string()));
    }
    void operator()(const Projection& node) const {
        for (const auto& column : node.columns) {
            hash_combine(seed, hash_string(column));
        }
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Column& node) const {
        hash_combine(seed, hash_string(node.name));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Selection& node) const {
        hash_combine(seed, structural_hash(*node.child));
        hash_combine(seed, structural_hash(*node.predicate));
    }
    void operator()(const ColumnWise& node) const {
        hash_combine(seed, scalar_hash(*node.scalar));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Reduction& node) const {
        hash_combine(seed, static_cast<std::size_t>(node.kind));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Summary& node) const {
        for (std::size_t i = 0; i < node.names.size(); ++i) {
            hash_combine(seed, hash_string(node.names[i]));
            hash_combine(seed, structural_hash(*node.values[i]));
        }
    }
    void operator()(const By& node) const {
        hash_combine(seed, structural_hash(*node.parent));
        hash_combine(seed, structural_hash(*node.grouper));
        hash_combine(seed, structural_hash(*node.apply));
    }
    void operator()(const Sort& node) const {
        hash_combine(seed, node.ascending ? 1U : 0U);
        hash_combine(seed, node.key.index());
        if (const auto* name = std::get_if<std::string>(&node.key)) {
            hash_combine(seed, hash_string(*name));
        } else if (const auto* names = std::get_if<std::vector<std::string>>(&node.key)) {
            for (const auto& n : *names) {
                hash_combine(seed, hash_string(n));
            }
        } else {
            hash_combine(seed, structural_hash(*std::get<ExprPtr>(node.key)));
        }
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Distinct& node) const {
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Head& node) const {
        hash_combine(seed, node.n);
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Label& node) const {
        hash_combine(seed, hash_string(node.label));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const ReLabel& node) const {
        for (const auto& [from, to] : node.labels) {
            hash_combine(seed, hash_string(from));
            hash_combine(seed, hash_string(to));
        }
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Map& node) const {
        hash_combine(seed, hash_string(node.func));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Apply& node) const {
        hash_combine(seed, hash_string(node.func));
        hash_combine(seed, structural_hash(*node.child));
    }
    void operator()(const Join& node) const {
        hash_combine(seed, hash_string(node.on_left));
        hash_combine(seed, hash_string(node.on_right));
        hash_combine(seed, structural_hash(*node.lhs));
        hash_combine(seed, structural_hash(*node.rhs));
    }
};

}  // namespace

auto kind_name(ExprKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ExprKind::Symbol:
            return "symbol";
        case ExprKind::Projection:
            return "projection";
        case ExprKind::Column:
            return "column";
        case ExprKind::Selection:
            return "selection";
        case ExprKind::ColumnWise:
            return "columnwise";
        case ExprKind::Reduction:
            return "reduction";
        case ExprKind::Summary:
            return "summary";
        case ExprKind::By:
            return "by";
        case ExprKind::Sort:
            return "sort";
        case ExprKind::Distinct:
            return "distinct";
        case ExprKind::Head:
            return "head";
        case ExprKind::Label:
            return "label";
        case ExprKind::ReLabel:
            return "relabel";
        case ExprKind::Map:
            return "map";
        case ExprKind::Apply:
            return "apply";
        case ExprKind::Join:
            return "join";
    }
    return "unknown";
}

auto reduction_name(ReductionKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ReductionKind::Any:
            return "any";
        case ReductionKind::All:
            return "all";
        case ReductionKind::Sum:
            return "sum";
        case ReductionKind::Min:
            return "min";
        case ReductionKind::Max:
            return "max";
        case ReductionKind::Mean:
            return "mean";
        case ReductionKind::Var:
            return "var";
        case ReductionKind::Std:
            return "std";
        case ReductionKind::Count:
            return "count";
        case ReductionKind::NUnique:
            return "nunique";
    }
    return "unknown";
}

auto dshape(const Expr& expr) -> std::expected<types::DataShape, Error> {
    return std::visit(ShapeOf{}, expr.node);
}

auto schema(const Expr& expr) -> std::expected<types::Record, Error> {
    auto shape = dshape(expr);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    if (const auto* apply = std::get_if<Apply>(&expr.node); apply != nullptr &&
                                                            !shape->is_tabular()) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("apply('{}') has non-tabular datashape '{}'", apply->func,
                                shape->to_string()));
    }
    return record_of(*shape);
}

auto columns(const Expr& expr) -> std::expected<std::vector<std::string>, Error> {
    auto record = schema(expr);
    if (!record.has_value()) {
        return std::unexpected(record.error());
    }
    return record->names();
}

auto dtype(const Expr& expr) -> std::expected<types::Primitive, Error> {
    auto record = schema(expr);
    if (!record.has_value()) {
        return std::unexpected(record.error());
    }
    if (record->size() != 1) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("dtype is not defined for multi-column {}; use schema instead",
                                record->to_string()));
    }
    return record->fields().front().type;
}

auto is_tabular(const Expr& expr) -> std::expected<bool, Error> {
    auto shape = dshape(expr);
    if (!shape.has_value()) {
        return std::unexpected(shape.error());
    }
    return shape->is_tabular();
}

auto structural_equal(const Expr& lhs, const Expr& rhs) -> bool {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.node.index() != rhs.node.index()) {
        return false;
    }
    if (lhs.hash != 0 && rhs.hash != 0 && lhs.hash != rhs.hash) {
        return false;
    }
    return std::visit(
        [&](const auto& l) -> bool {
            using T = std::decay_t<decltype(l)>;
            return SameNode{}(l, std::get<T>(rhs.node));
        },
        lhs.node);
}

auto structural_hash(const Expr& expr) -> std::size_t {
    if (expr.hash != 0) {
        return expr.hash;
    }
    std::size_t seed = expr.node.index();
    std::visit(HashOf{seed}, expr.node);
    return seed;
}

}  // namespace tablex::expr
