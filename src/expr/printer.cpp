#include <tablex/expr/printer.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace tablex::expr {

namespace {

auto quote(const std::string& name) -> std::string {
    return fmt::format("'{}'", name);
}

auto quote_list(const std::vector<std::string>& names) -> std::string {
    std::vector<std::string> quoted;
    quoted.reserve(names.size());
    for (const auto& name : names) {
        quoted.push_back(quote(name));
    }
    return fmt::format("[{}]", fmt::join(quoted, ", "));
}

struct Print {
    auto operator()(const Symbol& node) const -> std::string { return node.name; }

    auto operator()(const Projection& node) const -> std::string {
        return fmt::format("{}[{}]", to_string(*node.child), quote_list(node.columns));
    }

    auto operator()(const Column& node) const -> std::string {
        return fmt::format("{}[{}]", to_string(*node.child), quote(node.name));
    }

    auto operator()(const Selection& node) const -> std::string {
        return fmt::format("{}[{}]", to_string(*node.child), to_string(*node.predicate));
    }

    auto operator()(const ColumnWise& node) const -> std::string {
        auto source = to_string(*node.child);
        return to_string(*node.scalar, [&](const std::string& name) {
            return fmt::format("{}[{}]", source, quote(name));
        });
    }

    auto operator()(const Reduction& node) const -> std::string {
        return fmt::format("{}({})", reduction_name(node.kind), to_string(*node.child));
    }

    auto operator()(const Summary& node) const -> std::string {
        std::vector<std::string> parts;
        parts.reserve(node.names.size());
        for (std::size_t i = 0; i < node.names.size(); ++i) {
            parts.push_back(fmt::format("{}={}", node.names[i], to_string(*node.values[i])));
        }
        return fmt::format("summary({})", fmt::join(parts, ", "));
    }

    auto operator()(const By& node) const -> std::string {
        return fmt::format("by({}, {})", to_string(*node.grouper), to_string(*node.apply));
    }

    auto operator()(const Sort& node) const -> std::string {
        auto key = std::visit(
            [](const auto& k) -> std::string {
                using T = std::decay_t<decltype(k)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return quote(k);
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    return quote_list(k);
                } else {
                    return to_string(*k);
                }
            },
            node.key);
        if (node.ascending) {
            return fmt::format("{}.sort({})", to_string(*node.child), key);
        }
        return fmt::format("{}.sort({}, ascending=false)", to_string(*node.child), key);
    }

    auto operator()(const Distinct& node) const -> std::string {
        return fmt::format("distinct({})", to_string(*node.child));
    }

    auto operator()(const Head& node) const -> std::string {
        return fmt::format("{}.head({})", to_string(*node.child), node.n);
    }

    auto operator()(const Label& node) const -> std::string {
        return fmt::format("label({}, {})", to_string(*node.child), quote(node.label));
    }

    auto operator()(const ReLabel& node) const -> std::string {
        std::vector<std::string> parts;
        parts.reserve(node.labels.size());
        for (const auto& [from, to] : node.labels) {
            parts.push_back(fmt::format("{}={}", from, quote(to)));
        }
        return fmt::format("relabel({}, {})", to_string(*node.child), fmt::join(parts, ", "));
    }

    auto operator()(const Map& node) const -> std::string {
        return fmt::format("map({}, {})", to_string(*node.child), node.func);
    }

    auto operator()(const Apply& node) const -> std::string {
        return fmt::format("apply({}, {})", node.func, to_string(*node.child));
    }

    auto operator()(const Join& node) const -> std::string {
        return fmt::format("join({}, {}, {}, {})", to_string(*node.lhs), to_string(*node.rhs),
                           quote(node.on_left), quote(node.on_right));
    }
};

}  // namespace

auto to_string(const Expr& expr) -> std::string {
    return std::visit(Print{}, expr.node);
}

}  // namespace tablex::expr
