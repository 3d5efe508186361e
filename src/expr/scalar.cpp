#include <tablex/core/hash.hpp>
#include <tablex/expr/scalar.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>

namespace tablex::expr {

namespace {

void collect_symbols(const ScalarExpr& expr, std::vector<std::string>& out) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ScalarSymbol>) {
                out.push_back(node.name);
            } else if constexpr (std::is_same_v<T, ScalarUnary>) {
                collect_symbols(*node.operand, out);
            } else if constexpr (std::is_same_v<T, ScalarBinary>) {
                collect_symbols(*node.left, out);
                collect_symbols(*node.right, out);
            }
        },
        expr.node);
}

auto format_literal(const LiteralValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("'{}'", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto binary_dtype(BinaryOp op, types::Primitive lhs, types::Primitive rhs)
    -> std::expected<types::Primitive, Error> {
    using types::Primitive;
    if (is_logical(op)) {
        if (lhs != Primitive::Bool || rhs != Primitive::Bool) {
            return fail(ErrorKind::TypeMismatch,
                        fmt::format("'{}' expects bool operands, got {} and {}", to_string(op),
                                    types::to_string(lhs), types::to_string(rhs)));
        }
        return Primitive::Bool;
    }
    if (is_comparison(op)) {
        const bool comparable = (types::is_numeric(lhs) && types::is_numeric(rhs)) || lhs == rhs;
        if (!comparable) {
            return fail(ErrorKind::TypeMismatch,
                        fmt::format("cannot compare {} with {}", types::to_string(lhs),
                                    types::to_string(rhs)));
        }
        return Primitive::Bool;
    }
    if (!types::is_numeric(lhs) || !types::is_numeric(rhs)) {
        return fail(ErrorKind::TypeMismatch,
                    fmt::format("'{}' expects numeric operands, got {} and {}", to_string(op),
                                types::to_string(lhs), types::to_string(rhs)));
    }
    if (op == BinaryOp::Div && types::is_integral(lhs) && types::is_integral(rhs)) {
        return Primitive::Float64;
    }
    return types::promote(lhs, rhs);
}

auto unary_dtype(UnaryOp op, types::Primitive operand) -> std::expected<types::Primitive, Error> {
    using types::Primitive;
    switch (op) {
        case UnaryOp::Not:
            if (operand != Primitive::Bool) {
                return fail(ErrorKind::TypeMismatch,
                            fmt::format("'!' expects bool, got {}", types::to_string(operand)));
            }
            return Primitive::Bool;
        case UnaryOp::Neg:
        case UnaryOp::Abs:
            if (!types::is_numeric(operand)) {
                return fail(ErrorKind::TypeMismatch,
                            fmt::format("'{}' expects a numeric operand, got {}", to_string(op),
                                        types::to_string(operand)));
            }
            return operand;
        case UnaryOp::Sin:
        case UnaryOp::Cos:
        case UnaryOp::Tan:
        case UnaryOp::Exp:
        case UnaryOp::Log:
            if (!types::is_numeric(operand)) {
                return fail(ErrorKind::TypeMismatch,
                            fmt::format("'{}' expects a numeric operand, got {}", to_string(op),
                                        types::to_string(operand)));
            }
            return Primitive::Float64;
    }
    return operand;
}

}  // namespace

auto scalar_symbol(std::string name, types::Primitive type) -> ScalarPtr {
    return std::make_shared<const ScalarExpr>(
        ScalarExpr{.node = ScalarSymbol{.name = std::move(name), .type = type}});
}

auto scalar_literal(LiteralValue value) -> ScalarPtr {
    return std::make_shared<const ScalarExpr>(
        ScalarExpr{.node = ScalarLiteral{.value = std::move(value)}});
}

auto scalar_unary(UnaryOp op, ScalarPtr operand) -> ScalarPtr {
    return std::make_shared<const ScalarExpr>(
        ScalarExpr{.node = ScalarUnary{.op = op, .operand = std::move(operand)}});
}

auto scalar_binary(BinaryOp op, ScalarPtr left, ScalarPtr right) -> ScalarPtr {
    return std::make_shared<const ScalarExpr>(ScalarExpr{
        .node = ScalarBinary{.op = op, .left = std::move(left), .right = std::move(right)}});
}

auto is_comparison(BinaryOp op) noexcept -> bool {
    switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

auto is_logical(BinaryOp op) noexcept -> bool {
    return op == BinaryOp::And || op == BinaryOp::Or;
}

auto literal_type(const LiteralValue& value) noexcept -> types::Primitive {
    switch (value.index()) {
        case 0:
            return types::Primitive::Bool;
        case 1:
            return types::Primitive::Int64;
        case 2:
            return types::Primitive::Float64;
        default:
            return types::Primitive::String;
    }
}

auto dtype(const ScalarExpr& expr) -> std::expected<types::Primitive, Error> {
    return std::visit(
        [](const auto& node) -> std::expected<types::Primitive, Error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ScalarSymbol>) {
                return node.type;
            } else if constexpr (std::is_same_v<T, ScalarLiteral>) {
                return literal_type(node.value);
            } else if constexpr (std::is_same_v<T, ScalarUnary>) {
                auto operand = dtype(*node.operand);
                if (!operand.has_value()) {
                    return operand;
                }
                return unary_dtype(node.op, *operand);
            } else {
                auto lhs = dtype(*node.left);
                if (!lhs.has_value()) {
                    return lhs;
                }
                auto rhs = dtype(*node.right);
                if (!rhs.has_value()) {
                    return rhs;
                }
                return binary_dtype(node.op, *lhs, *rhs);
            }
        },
        expr.node);
}

auto symbol_names(const ScalarExpr& expr) -> std::vector<std::string> {
    std::vector<std::string> names;
    collect_symbols(expr, names);
    std::ranges::sort(names);
    auto dup = std::ranges::unique(names);
    names.erase(dup.begin(), dup.end());
    return names;
}

auto first_symbol(const ScalarExpr& expr) -> const ScalarSymbol* {
    if (const auto* sym = std::get_if<ScalarSymbol>(&expr.node)) {
        return sym;
    }
    if (const auto* unary = std::get_if<ScalarUnary>(&expr.node)) {
        return first_symbol(*unary->operand);
    }
    if (const auto* binary = std::get_if<ScalarBinary>(&expr.node)) {
        if (const auto* sym = first_symbol(*binary->left)) {
            return sym;
        }
        return first_symbol(*binary->right);
    }
    return nullptr;
}

auto scalar_equal(const ScalarExpr& lhs, const ScalarExpr& rhs) -> bool {
    if (&lhs == &rhs) {
        return true;
    }
    if (lhs.node.index() != rhs.node.index()) {
        return false;
    }
    return std::visit(
        [&](const auto& l) -> bool {
            using T = std::decay_t<decltype(l)>;
            const auto& r = std::get<T>(rhs.node);
            if constexpr (std::is_same_v<T, ScalarSymbol>) {
                return l.name == r.name && l.type == r.type;
            } else if constexpr (std::is_same_v<T, ScalarLiteral>) {
                return l.value == r.value;
            } else if constexpr (std::is_same_v<T, ScalarUnary>) {
                return l.op == r.op && scalar_equal(*l.operand, *r.operand);
            } else {
                return l.op == r.op && scalar_equal(*l.left, *r.left) &&
                       scalar_equal(*l.right, *r.right);
            }
        },
        lhs.node);
}

auto scalar_hash(const ScalarExpr& expr) -> std::size_t {
    std::size_t seed = expr.node.index();
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ScalarSymbol>) {
                hash_combine(seed, std::hash<std::string>{}(node.name));
                hash_combine(seed, static_cast<std::size_t>(node.type));
            } else if constexpr (std::is_same_v<T, ScalarLiteral>) {
                hash_combine(seed, std::hash<LiteralValue>{}(node.value));
            } else if constexpr (std::is_same_v<T, ScalarUnary>) {
                hash_combine(seed, static_cast<std::size_t>(node.op));
                hash_combine(seed, scalar_hash(*node.operand));
            } else {
                hash_combine(seed, static_cast<std::size_t>(node.op));
                hash_combine(seed, scalar_hash(*node.left));
                hash_combine(seed, scalar_hash(*node.right));
            }
        },
        expr.node);
    return seed;
}

auto to_string(const ScalarExpr& expr,
               const std::function<std::string(const std::string&)>& symbol_text)
    -> std::string {
    return std::visit(
        [&](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ScalarSymbol>) {
                return symbol_text ? symbol_text(node.name) : node.name;
            } else if constexpr (std::is_same_v<T, ScalarLiteral>) {
                return format_literal(node.value);
            } else if constexpr (std::is_same_v<T, ScalarUnary>) {
                auto operand = to_string(*node.operand, symbol_text);
                if (node.op == UnaryOp::Neg || node.op == UnaryOp::Not) {
                    if (std::holds_alternative<ScalarBinary>(node.operand->node)) {
                        return fmt::format("{}({})", to_string(node.op), operand);
                    }
                    return fmt::format("{}{}", to_string(node.op), operand);
                }
                return fmt::format("{}({})", to_string(node.op), operand);
            } else {
                // Parenthesize nested binaries; precedence is not tracked.
                auto side = [&](const ScalarExpr& e) {
                    auto text = to_string(e, symbol_text);
                    return std::holds_alternative<ScalarBinary>(e.node) ? "(" + text + ")" : text;
                };
                return fmt::format("{} {} {}", side(*node.left), to_string(node.op),
                                   side(*node.right));
            }
        },
        expr.node);
}

auto to_string(UnaryOp op) -> std::string_view {
    switch (op) {
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Not:
            return "!";
        case UnaryOp::Abs:
            return "abs";
        case UnaryOp::Sin:
            return "sin";
        case UnaryOp::Cos:
            return "cos";
        case UnaryOp::Tan:
            return "tan";
        case UnaryOp::Exp:
            return "exp";
        case UnaryOp::Log:
            return "log";
    }
    return "?";
}

auto to_string(BinaryOp op) -> std::string_view {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Pow:
            return "**";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

}  // namespace tablex::expr
