#include <tablex/tablex.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

auto main() -> int {
    // TABLEX_LOG_LEVEL=debug shows each leaf restriction made by the optimizer.
    if (const char* level = std::getenv("TABLEX_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }

    try {
        auto t = tablex::ops::symbol("t", "var * {a: int32, b: int32, c: int32, d: int32}");

        fmt::print("=== Selection ===\n");
        auto expr = t[t["a"] > 0]["b"];
        fmt::print("expr:   {}\n", expr.to_string());
        fmt::print("schema: {}\n", expr.dshape().to_string());
        fmt::print("lean:   {}\n", tablex::ops::lean_projection(expr).to_string());

        fmt::print("\n=== Group by ===\n");
        auto sales = tablex::ops::symbol(
            "sales", "var * {id: int64, name: string, amount: float64, region: string}");
        auto totals = tablex::ops::by(sales["name"], sales["amount"].sum());
        fmt::print("expr:   {}\n", totals.to_string());
        fmt::print("schema: {}\n", totals.dshape().to_string());
        fmt::print("lean:   {}\n", tablex::ops::lean_projection(totals).to_string());

        fmt::print("\n=== Join ===\n");
        auto names = tablex::ops::symbol("names", "var * {id: int64, name: string, age: int32}");
        auto amounts = tablex::ops::symbol("amounts", "var * {id: int64, amount: float64}");
        auto joined =
            tablex::ops::join(names, amounts, "id")[std::vector<std::string>{"name", "amount"}];
        fmt::print("expr:   {}\n", joined.to_string());
        fmt::print("lean:   {}\n", tablex::ops::lean_projection(joined).to_string());
    } catch (const tablex::Exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
