#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/printer.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace tablex;
using namespace tablex::expr;
using types::Primitive;

namespace {

auto ok(ExprResult result) -> ExprPtr {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    return *result;
}

auto accounts() -> ExprPtr {
    return ok(symbol("t", "var * {name: string, amount: int64, rate: float64}"));
}

}  // namespace

TEST_CASE("columnwise: column and literal fuse over the column's table", "[columnwise]") {
    auto t = accounts();
    auto fused = ok(columnwise(BinaryOp::Mul, ok(column(t, "amount")), 2));

    REQUIRE(fused->kind() == ExprKind::ColumnWise);
    const auto& node = std::get<ColumnWise>(fused->node);
    CHECK(node.child == t);
    CHECK(active_columns(node) == std::vector<std::string>{"amount"});
    CHECK(dtype(*fused).value() == Primitive::Int64);
    CHECK(to_string(*fused) == "t['amount'] * 2");
}

TEST_CASE("columnwise: nested operations collapse into one node", "[columnwise]") {
    auto t = accounts();
    auto scaled = ok(columnwise(BinaryOp::Mul, ok(column(t, "amount")), ok(column(t, "rate"))));
    auto positive = ok(columnwise(BinaryOp::Gt, scaled, 0));

    REQUIRE(positive->kind() == ExprKind::ColumnWise);
    const auto& node = std::get<ColumnWise>(positive->node);
    CHECK(node.child == t);
    CHECK(active_columns(node) == std::vector<std::string>{"amount", "rate"});
    CHECK(dtype(*positive).value() == Primitive::Bool);
    CHECK(columns(*positive).value() == std::vector<std::string>{"amount"});
}

TEST_CASE("columnwise: unary operations", "[columnwise]") {
    auto t = accounts();
    auto logged = ok(columnwise(UnaryOp::Log, ok(column(t, "rate"))));
    CHECK(to_string(*logged) == "log(t['rate'])");
    CHECK(dtype(*logged).value() == Primitive::Float64);
}

TEST_CASE("columnwise: the source only needs structural equality", "[columnwise]") {
    auto lhs = accounts();
    auto rhs = accounts();
    auto sum = columnwise(BinaryOp::Add, ok(column(lhs, "amount")), ok(column(rhs, "amount")));
    REQUIRE(sum.has_value());
    CHECK(std::get<ColumnWise>((*sum)->node).child == lhs);
}

TEST_CASE("columnwise: operands from different tables", "[columnwise]") {
    auto t = accounts();
    auto u = ok(symbol("u", "var * {amount: int64}"));
    auto mixed = columnwise(BinaryOp::Add, ok(column(t, "amount")), ok(column(u, "amount")));
    REQUIRE_FALSE(mixed.has_value());
    CHECK(mixed.error().kind == ErrorKind::MismatchedSourceTable);

    auto narrowed = ok(projection(t, {"amount"}));
    auto across = columnwise(BinaryOp::Add, ok(column(t, "amount")),
                             ok(column(narrowed, "amount")));
    REQUIRE_FALSE(across.has_value());
    CHECK(across.error().kind == ErrorKind::MismatchedSourceTable);
}

TEST_CASE("columnwise: rejected operands", "[columnwise]") {
    auto t = accounts();

    auto table_operand = columnwise(BinaryOp::Add, t, 1);
    REQUIRE_FALSE(table_operand.has_value());
    CHECK(table_operand.error().kind == ErrorKind::InvalidArgument);

    auto literals = columnwise(BinaryOp::Add, 1, 2);
    REQUIRE_FALSE(literals.has_value());
    CHECK(literals.error().kind == ErrorKind::InvalidArgument);

    auto bad_type = columnwise(BinaryOp::Add, ok(column(t, "name")), 1);
    REQUIRE_FALSE(bad_type.has_value());
    CHECK(bad_type.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("columnwise: fuse with a custom combiner", "[columnwise]") {
    auto t = accounts();
    std::vector<Operand> inputs{ok(column(t, "amount")), ok(column(t, "rate")), 1.5};
    auto fused = fuse(std::move(inputs), [](std::vector<ScalarPtr> scalars) {
        auto sum = scalar_binary(BinaryOp::Add, std::move(scalars[0]), std::move(scalars[1]));
        return scalar_binary(BinaryOp::Lt, std::move(sum), std::move(scalars[2]));
    });
    REQUIRE(fused.has_value());
    CHECK(to_string(**fused) == "(t['amount'] + t['rate']) < 1.5");
}
