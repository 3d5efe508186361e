#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/printer.hpp>
#include <tablex/optimize/common_subexpression.hpp>

#include <catch2/catch.hpp>

using namespace tablex;
using namespace tablex::expr;
using tablex::optimize::common_subexpression;
using tablex::optimize::Interner;

namespace {

auto ok(ExprResult result) -> ExprPtr {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    return *result;
}

auto accounts() -> ExprPtr {
    return ok(symbol("t", "var * {name: string, amount: int64, id: int32}"));
}

}  // namespace

TEST_CASE("common_subexpression: grouper and reduction share their table", "[cse]") {
    auto t = accounts();
    auto grouper = ok(column(t, "name"));
    auto total = ok(reduction(ReductionKind::Sum, ok(column(t, "amount"))));

    auto shared = common_subexpression(grouper, total);
    REQUIRE(shared.has_value());
    CHECK(*shared == t);
}

TEST_CASE("common_subexpression: prefers the largest shared node", "[cse]") {
    auto t = accounts();
    auto positive = ok(selection(t, ok(columnwise(BinaryOp::Gt, ok(column(t, "amount")), 0))));
    auto grouper = ok(column(positive, "name"));
    auto total = ok(reduction(ReductionKind::Sum, ok(column(positive, "amount"))));

    auto shared = common_subexpression(grouper, total);
    REQUIRE(shared.has_value());
    CHECK(to_string(**shared) == "t[t['amount'] > 0]");
}

TEST_CASE("common_subexpression: structurally equal copies match", "[cse]") {
    auto grouper = ok(column(accounts(), "name"));
    auto total = ok(reduction(ReductionKind::Count, ok(column(accounts(), "id"))));

    auto shared = common_subexpression(grouper, total);
    REQUIRE(shared.has_value());
    CHECK(to_string(**shared) == "t");
}

TEST_CASE("common_subexpression: disjoint trees", "[cse]") {
    auto t = accounts();
    auto u = ok(symbol("u", "var * {id: int32}"));

    auto none = common_subexpression(ok(column(t, "id")), ok(column(u, "id")));
    REQUIRE_FALSE(none.has_value());
    CHECK(none.error().kind == ErrorKind::NoCommonAncestor);

    auto missing = common_subexpression(t, nullptr);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("interner: returns the first structurally equal node", "[cse]") {
    Interner interner;
    auto first = accounts();
    auto second = accounts();
    REQUIRE(first != second);

    CHECK(interner.intern(first) == first);
    CHECK(interner.intern(second) == first);
    CHECK(interner.size() == 1);

    auto col = ok(column(first, "id"));
    CHECK(interner.intern(col) == col);
    CHECK(interner.intern(ok(column(second, "id"))) == col);
    CHECK(interner.size() == 2);
}

TEST_CASE("common_subexpression: deep shared chains", "[cse]") {
    auto current = accounts();
    for (int i = 0; i < 12; ++i) {
        current = ok(selection(current,
                               ok(columnwise(BinaryOp::Gt, ok(column(current, "amount")), i))));
    }
    auto grouper = ok(column(current, "name"));
    auto total = ok(reduction(ReductionKind::Sum, ok(column(current, "amount"))));

    auto shared = common_subexpression(grouper, total);
    REQUIRE(shared.has_value());
    CHECK(*shared == current);
}
