#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/printer.hpp>

#include <fmt/core.h>

namespace tablex::expr {

namespace {

struct Classified {
    ScalarPtr scalar;
    ExprPtr source;  // null for literals
};

auto classify(const Operand& operand) -> std::expected<Classified, Error> {
    if (const auto* literal = std::get_if<LiteralValue>(&operand.value)) {
        return Classified{.scalar = scalar_literal(*literal), .source = nullptr};
    }
    const auto& expr = std::get<ExprPtr>(operand.value);
    if (!expr) {
        return fail(ErrorKind::InvalidArgument, "column-wise operand is empty");
    }
    if (const auto* node = std::get_if<ColumnWise>(&expr->node)) {
        return Classified{.scalar = node->scalar, .source = node->child};
    }
    if (const auto* node = std::get_if<Column>(&expr->node)) {
        auto type = dtype(*expr);
        if (!type.has_value()) {
            return std::unexpected(type.error());
        }
        return Classified{.scalar = scalar_symbol(node->name, *type), .source = node->child};
    }
    return fail(ErrorKind::InvalidArgument,
                fmt::format("cannot use {} node '{}' as a column-wise operand",
                            kind_name(expr->kind()), to_string(*expr)));
}

}  // namespace

auto fuse(std::vector<Operand> inputs, const ScalarCombiner& combine) -> ExprResult {
    std::vector<ScalarPtr> scalars;
    scalars.reserve(inputs.size());
    ExprPtr source;
    for (const auto& input : inputs) {
        auto classified = classify(input);
        if (!classified.has_value()) {
            return std::unexpected(classified.error());
        }
        if (classified->source) {
            if (!source) {
                source = classified->source;
            } else if (!structural_equal(*source, *classified->source)) {
                return fail(ErrorKind::MismatchedSourceTable,
                            fmt::format("column-wise operands come from different tables: {} "
                                        "and {}",
                                        to_string(*source), to_string(*classified->source)));
            }
        }
        scalars.push_back(std::move(classified->scalar));
    }
    if (!source) {
        return fail(ErrorKind::InvalidArgument, "column-wise operation needs at least one column");
    }
    return broadcast(std::move(source), combine(std::move(scalars)));
}

auto columnwise(BinaryOp op, Operand lhs, Operand rhs) -> ExprResult {
    std::vector<Operand> inputs;
    inputs.push_back(std::move(lhs));
    inputs.push_back(std::move(rhs));
    return fuse(std::move(inputs), [op](std::vector<ScalarPtr> scalars) {
        return scalar_binary(op, std::move(scalars[0]), std::move(scalars[1]));
    });
}

auto columnwise(UnaryOp op, Operand operand) -> ExprResult {
    std::vector<Operand> inputs;
    inputs.push_back(std::move(operand));
    return fuse(std::move(inputs), [op](std::vector<ScalarPtr> scalars) {
        return scalar_unary(op, std::move(scalars[0]));
    });
}

auto active_columns(const ColumnWise& node) -> std::vector<std::string> {
    return symbol_names(*node.scalar);
}

}  // namespace tablex::expr
