#include <tablex/expr/printer.hpp>
#include <tablex/ops/ops.hpp>
#include <tablex/optimize/common_subexpression.hpp>
#include <tablex/optimize/lean_projection.hpp>

namespace tablex::ops {

namespace {

template <typename T>
auto value_or_throw(std::expected<T, Error> result) -> T {
    if (!result.has_value()) {
        throw Exception(std::move(result.error()));
    }
    return std::move(*result);
}

}  // namespace

Expression::Expression(expr::ExprPtr node) : node_(std::move(node)) {
    if (!node_) {
        throw Exception(Error{.kind = ErrorKind::InvalidArgument, .message = "empty expression"});
    }
}

auto Expression::dshape() const -> types::DataShape {
    return value_or_throw(expr::dshape(*node_));
}

auto Expression::schema() const -> types::Record {
    return value_or_throw(expr::schema(*node_));
}

auto Expression::columns() const -> std::vector<std::string> {
    return value_or_throw(expr::columns(*node_));
}

auto Expression::dtype() const -> types::Primitive {
    return value_or_throw(expr::dtype(*node_));
}

auto Expression::to_string() const -> std::string {
    return expr::to_string(*node_);
}

auto Expression::operator[](std::string name) const -> Expression {
    return unwrap(expr::column(node_, std::move(name)));
}

auto Expression::operator[](std::vector<std::string> names) const -> Expression {
    return unwrap(expr::projection(node_, std::move(names)));
}

auto Expression::operator[](const Expression& predicate) const -> Expression {
    return unwrap(expr::selection(node_, predicate.node()));
}

auto Expression::any() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Any, node_));
}

auto Expression::all() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::All, node_));
}

auto Expression::sum() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Sum, node_));
}

auto Expression::min() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Min, node_));
}

auto Expression::max() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Max, node_));
}

auto Expression::mean() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Mean, node_));
}

auto Expression::var() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Var, node_));
}

auto Expression::stddev() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Std, node_));
}

auto Expression::count() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::Count, node_));
}

auto Expression::nunique() const -> Expression {
    return unwrap(expr::reduction(expr::ReductionKind::NUnique, node_));
}

auto Expression::distinct() const -> Expression {
    return unwrap(expr::distinct(node_));
}

auto Expression::head(std::size_t n) const -> Expression {
    return unwrap(expr::head(node_, n));
}

auto Expression::sort() const -> Expression {
    auto names = columns();
    if (names.empty()) {
        throw Exception(Error{.kind = ErrorKind::InvalidArgument,
                              .message = "cannot sort an expression without columns"});
    }
    return sort(names.front());
}

auto Expression::sort(expr::SortKey key, bool ascending) const -> Expression {
    return unwrap(expr::sort(node_, std::move(key), ascending));
}

auto Expression::label(std::string name) const -> Expression {
    return unwrap(expr::label(node_, std::move(name)));
}

auto Expression::relabel(std::vector<std::pair<std::string, std::string>> labels) const
    -> Expression {
    return unwrap(expr::relabel(node_, std::move(labels)));
}

auto Expression::map(std::string func, std::optional<types::Record> schema) const -> Expression {
    return unwrap(expr::map(node_, std::move(func), std::move(schema)));
}

auto Expression::apply(std::string func, std::optional<types::DataShape> declared) const
    -> Expression {
    return unwrap(expr::apply(node_, std::move(func), std::move(declared)));
}

auto unwrap(expr::ExprResult result) -> Expression {
    return Expression(value_or_throw(std::move(result)));
}

auto symbol(std::string name, std::string_view dshape) -> Expression {
    return unwrap(expr::symbol(std::move(name), dshape));
}

auto summary(std::vector<std::pair<std::string, Expression>> entries) -> Expression {
    std::vector<std::pair<std::string, expr::ExprPtr>> nodes;
    nodes.reserve(entries.size());
    for (auto& [name, value] : entries) {
        nodes.emplace_back(std::move(name), value.node());
    }
    return unwrap(expr::summary(std::move(nodes)));
}

auto by(const Expression& grouper, const Expression& apply) -> Expression {
    auto parent = value_or_throw(optimize::common_subexpression(grouper.node(), apply.node()));
    return unwrap(expr::by(std::move(parent), grouper.node(), apply.node()));
}

auto join(const Expression& lhs, const Expression& rhs, std::string on_left, std::string on_right)
    -> Expression {
    return unwrap(expr::join(lhs.node(), rhs.node(), std::move(on_left), std::move(on_right)));
}

auto lean_projection(const Expression& expr) -> Expression {
    return unwrap(optimize::lean_projection(expr.node()));
}

auto binary(expr::BinaryOp op, expr::Operand lhs, expr::Operand rhs) -> Expression {
    return unwrap(expr::columnwise(op, std::move(lhs), std::move(rhs)));
}

auto unary(expr::UnaryOp op, const Expression& operand) -> Expression {
    return unwrap(expr::columnwise(op, as_operand(operand)));
}

auto operator-(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Neg, operand);
}

auto operator~(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Not, operand);
}

auto abs(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Abs, operand);
}

auto sin(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Sin, operand);
}

auto cos(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Cos, operand);
}

auto tan(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Tan, operand);
}

auto exp(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Exp, operand);
}

auto log(const Expression& operand) -> Expression {
    return unary(expr::UnaryOp::Log, operand);
}

}  // namespace tablex::ops
