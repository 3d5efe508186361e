#include <tablex/expr/builder.hpp>
#include <tablex/expr/columnwise.hpp>
#include <tablex/expr/node.hpp>
#include <tablex/expr/printer.hpp>
#include <tablex/types/parser.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace tablex;
using namespace tablex::expr;
using types::Primitive;

namespace {

auto table(std::string name, std::string_view shape) -> ExprPtr {
    auto sym = symbol(std::move(name), shape);
    REQUIRE(sym.has_value());
    return *sym;
}

auto ok(ExprResult result) -> ExprPtr {
    if (!result.has_value()) {
        FAIL(result.error().format());
    }
    return *result;
}

auto shape_text(const ExprPtr& e) -> std::string {
    auto shape = dshape(*e);
    REQUIRE(shape.has_value());
    return shape->to_string();
}

auto positive(const ExprPtr& t, const std::string& name) -> ExprPtr {
    return ok(columnwise(BinaryOp::Gt, ok(column(t, name)), 0));
}

}  // namespace

// ─── Leaves and projections ──────────────────────────────────────────────────

TEST_CASE("node: symbol carries its declared shape", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    CHECK(t->kind() == ExprKind::Symbol);
    CHECK(shape_text(t) == "var * {a: int32, b: string}");
    CHECK(columns(*t).value() == std::vector<std::string>{"a", "b"});
}

TEST_CASE("node: symbol needs a tabular record shape", "[node]") {
    auto scalar = symbol("x", "int32");
    REQUIRE_FALSE(scalar.has_value());
    CHECK(scalar.error().kind == ErrorKind::InvalidArgument);

    auto unparsable = symbol("x", "var * {a: }");
    REQUIRE_FALSE(unparsable.has_value());
    CHECK(unparsable.error().kind == ErrorKind::ParseError);
}

TEST_CASE("node: projection restricts and reorders", "[node]") {
    auto t = table("t", "var * {a: int32, b: string, c: float64}");
    auto p = ok(projection(t, {"c", "a"}));
    CHECK(shape_text(p) == "var * {c: float64, a: int32}");
    CHECK(to_string(*p) == "t[['c', 'a']]");
}

TEST_CASE("node: projection construction errors", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");

    auto unknown = projection(t, {"a", "z"});
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::UnknownColumn);

    auto duplicate = projection(t, {"a", "a"});
    REQUIRE_FALSE(duplicate.has_value());
    CHECK(duplicate.error().kind == ErrorKind::DuplicateField);

    auto empty = projection(t, {});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("node: column is a single-field table", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto b = ok(column(t, "b"));
    CHECK(shape_text(b) == "var * {b: string}");
    CHECK(dtype(*b).value() == Primitive::String);
    CHECK(to_string(*b) == "t['b']");

    auto missing = column(t, "z");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::UnknownColumn);
}

TEST_CASE("node: dtype of a multi-field table is a type mismatch", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto type = dtype(*t);
    REQUIRE_FALSE(type.has_value());
    CHECK(type.error().kind == ErrorKind::TypeMismatch);
}

// ─── Selection ───────────────────────────────────────────────────────────────

TEST_CASE("node: selection keeps the child's shape", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto sel = ok(selection(t, positive(t, "a")));
    CHECK(shape_text(sel) == "var * {a: int32, b: string}");
    CHECK(to_string(*sel) == "t[t['a'] > 0]");
}

TEST_CASE("node: selection requires a boolean predicate", "[node]") {
    auto t = table("t", "var * {a: int32, flag: bool}");

    auto numeric = selection(t, ok(column(t, "a")));
    REQUIRE_FALSE(numeric.has_value());
    CHECK(numeric.error().kind == ErrorKind::NonBooleanPredicate);

    auto wide = selection(t, t);
    REQUIRE_FALSE(wide.has_value());
    CHECK(wide.error().kind == ErrorKind::NonBooleanPredicate);

    CHECK(selection(t, ok(column(t, "flag"))).has_value());
}

TEST_CASE("node: selection predicate must be built on its child", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto u = table("u", "var * {a: int32}");

    auto other = selection(t, positive(u, "a"));
    REQUIRE_FALSE(other.has_value());
    CHECK(other.error().kind == ErrorKind::MismatchedSourceTable);

    auto narrowed = ok(projection(t, {"b"}));
    auto wider = selection(narrowed, positive(t, "a"));
    REQUIRE_FALSE(wider.has_value());
    CHECK(wider.error().kind == ErrorKind::MismatchedSourceTable);

    auto copy = table("t", "var * {a: int32, b: string}");
    CHECK(selection(t, positive(copy, "a")).has_value());
}

// ─── Broadcast ───────────────────────────────────────────────────────────────

TEST_CASE("node: broadcast is named after its first placeholder", "[node]") {
    auto t = table("t", "var * {a: int32, b: float64}");
    auto scalar = scalar_binary(BinaryOp::Mul, scalar_symbol("b", Primitive::Float64),
                                scalar_symbol("a", Primitive::Int32));
    auto cw = ok(broadcast(t, scalar));
    CHECK(shape_text(cw) == "var * {b: float64}");
}

TEST_CASE("node: broadcast placeholders must match the table", "[node]") {
    auto t = table("t", "var * {a: int32}");

    auto unknown = broadcast(t, scalar_symbol("z", Primitive::Int32));
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::UnknownColumn);

    auto wrong_type = broadcast(t, scalar_symbol("a", Primitive::Int64));
    REQUIRE_FALSE(wrong_type.has_value());
    CHECK(wrong_type.error().kind == ErrorKind::TypeMismatch);

    auto constant = broadcast(t, scalar_literal(std::int64_t{1}));
    REQUIRE_FALSE(constant.has_value());
    CHECK(constant.error().kind == ErrorKind::InvalidArgument);
}

// ─── Reductions and summaries ────────────────────────────────────────────────

TEST_CASE("node: reduction result types", "[node]") {
    auto t = table("t", "var * {a: int32, s: string}");
    auto a = ok(column(t, "a"));

    CHECK(shape_text(ok(reduction(ReductionKind::Sum, a))) == "{a: int32}");
    CHECK(shape_text(ok(reduction(ReductionKind::Max, a))) == "{a: int32}");
    CHECK(shape_text(ok(reduction(ReductionKind::Count, a))) == "{a: int64}");
    CHECK(shape_text(ok(reduction(ReductionKind::NUnique, ok(column(t, "s"))))) == "{s: int64}");
    CHECK(shape_text(ok(reduction(ReductionKind::Mean, a))) == "{a: float64}");
    CHECK(shape_text(ok(reduction(ReductionKind::Std, a))) == "{a: float64}");
    CHECK(shape_text(ok(reduction(ReductionKind::Any, a))) == "{a: bool}");

    auto sum = ok(reduction(ReductionKind::Sum, a));
    CHECK_FALSE(is_tabular(*sum).value());
    CHECK(to_string(*sum) == "sum(t['a'])");
}

TEST_CASE("node: reduction needs a single field", "[node]") {
    auto t = table("t", "var * {a: int32, b: int32}");
    auto wide = reduction(ReductionKind::Sum, t);
    REQUIRE_FALSE(wide.has_value());
    CHECK(wide.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("node: summary has one field per name", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto s = ok(summary({
        {"total", ok(reduction(ReductionKind::Sum, ok(column(t, "a"))))},
        {"cnt", ok(reduction(ReductionKind::Count, ok(column(t, "b"))))},
    }));
    CHECK(shape_text(s) == "{total: int32, cnt: int64}");
    CHECK(to_string(*s) == "summary(total=sum(t['a']), cnt=count(t['b']))");
}

TEST_CASE("node: summary construction errors", "[node]") {
    auto t = table("t", "var * {a: int32}");
    auto total = ok(reduction(ReductionKind::Sum, ok(column(t, "a"))));

    auto duplicate = summary({{"x", total}, {"x", total}});
    REQUIRE_FALSE(duplicate.has_value());
    CHECK(duplicate.error().kind == ErrorKind::DuplicateField);

    auto rows = summary({{"x", ok(column(t, "a"))}});
    REQUIRE_FALSE(rows.has_value());
    CHECK(rows.error().kind == ErrorKind::InvalidArgument);
}

// ─── Grouping ────────────────────────────────────────────────────────────────

TEST_CASE("node: by puts grouper fields first", "[node]") {
    auto t = table("t", "var * {name: string, amount: float64, id: int64}");
    auto grouped = ok(by(t, ok(column(t, "name")),
                         ok(reduction(ReductionKind::Sum, ok(column(t, "amount"))))));
    CHECK(shape_text(grouped) == "var * {name: string, amount: float64}");
    CHECK(to_string(*grouped) == "by(t['name'], sum(t['amount']))");
}

TEST_CASE("node: by drops apply fields named like grouper fields", "[node]") {
    auto t = table("t", "var * {name: string, amount: float64}");
    auto grouped = ok(by(t, ok(column(t, "name")),
                         ok(reduction(ReductionKind::Count, ok(column(t, "name"))))));
    CHECK(shape_text(grouped) == "var * {name: string}");
}

TEST_CASE("node: by construction errors", "[node]") {
    auto t = table("t", "var * {name: string, amount: float64}");
    auto u = table("u", "var * {name: string, amount: float64}");
    auto name = ok(column(t, "name"));

    auto rows = by(t, name, ok(column(t, "amount")));
    REQUIRE_FALSE(rows.has_value());
    CHECK(rows.error().kind == ErrorKind::NonReducingApply);

    auto elsewhere = by(u, name, ok(reduction(ReductionKind::Sum, ok(column(t, "amount")))));
    REQUIRE_FALSE(elsewhere.has_value());
    CHECK(elsewhere.error().kind == ErrorKind::InvalidArgument);
}

// ─── Row-order and row-count operators ───────────────────────────────────────

TEST_CASE("node: sort keys must exist", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto sorted = ok(expr::sort(t, std::string("b"), false));
    CHECK(shape_text(sorted) == "var * {a: int32, b: string}");
    CHECK(to_string(*sorted) == "t.sort('b', ascending=false)");

    auto multi = ok(expr::sort(t, std::vector<std::string>{"b", "a"}));
    CHECK(to_string(*multi) == "t.sort(['b', 'a'])");

    auto missing = expr::sort(t, std::string("z"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::UnknownColumn);

    auto u = table("u", "var * {a: int32}");
    auto foreign = expr::sort(t, ok(column(u, "a")));
    REQUIRE_FALSE(foreign.has_value());
    CHECK(foreign.error().kind == ErrorKind::MismatchedSourceTable);
}

TEST_CASE("node: head fixes the dimension", "[node]") {
    auto t = table("t", "var * {a: int32}");
    auto top = ok(head(t, 5));
    CHECK(shape_text(top) == "5 * {a: int32}");
    CHECK(to_string(*top) == "t.head(5)");
    CHECK(shape_text(ok(head(t))) == "10 * {a: int32}");

    auto total = ok(reduction(ReductionKind::Sum, ok(column(t, "a"))));
    auto bad = head(total);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("node: distinct keeps the shape", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto d = ok(distinct(t));
    CHECK(shape_text(d) == "var * {a: int32, b: string}");
    CHECK(to_string(*d) == "distinct(t)");
}

// ─── Renaming ────────────────────────────────────────────────────────────────

TEST_CASE("node: label renames a single field", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto lbl = ok(label(ok(column(t, "a")), "x"));
    CHECK(shape_text(lbl) == "var * {x: int32}");

    auto wide = ok(label(t, "x"));
    auto shape = dshape(*wide);
    REQUIRE_FALSE(shape.has_value());
    CHECK(shape.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("node: relabel substitutes names in place", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto renamed = ok(relabel(t, {{"a", "x"}}));
    CHECK(shape_text(renamed) == "var * {x: int32, b: string}");
    CHECK(to_string(*renamed) == "relabel(t, a='x')");

    auto unknown = relabel(t, {{"z", "x"}});
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::UnknownColumn);

    auto clash = relabel(t, {{"a", "b"}});
    REQUIRE_FALSE(clash.has_value());
    CHECK(clash.error().kind == ErrorKind::DuplicateField);
}

// ─── User functions ──────────────────────────────────────────────────────────

TEST_CASE("node: map and apply need a declared shape", "[node]") {
    auto t = table("t", "var * {a: int32}");

    auto undeclared = ok(map(t, "inc"));
    auto missing = schema(*undeclared);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::UndefinedShape);
    CHECK(category(missing.error().kind) == ErrorCategory::SchemaInference);

    auto declared = ok(map(t, "inc", types::parse_record("{a: int64}").value()));
    CHECK(shape_text(declared) == "var * {a: int64}");
    CHECK(to_string(*declared) == "map(t, inc)");

    auto applied = ok(expr::apply(t, "total", types::parse_dshape("{total: int64}").value()));
    CHECK(shape_text(applied) == "{total: int64}");
    CHECK(to_string(*applied) == "apply(total, t)");

    auto opaque = ok(expr::apply(t, "f"));
    REQUIRE_FALSE(schema(*opaque).has_value());
    CHECK(schema(*opaque).error().kind == ErrorKind::UndefinedShape);

    auto primitive = ok(expr::apply(t, "f", types::parse_dshape("float64").value()));
    REQUIRE_FALSE(schema(*primitive).has_value());
    CHECK(schema(*primitive).error().kind == ErrorKind::TypeMismatch);
}

// ─── Join ────────────────────────────────────────────────────────────────────

TEST_CASE("node: join merges fields without the right key", "[node]") {
    auto names = table("names", "var * {id: int64, name: string}");
    auto amounts = table("amounts", "var * {id: int64, amount: float64}");
    auto joined = ok(join(names, amounts, "id"));
    CHECK(shape_text(joined) == "var * {id: int64, name: string, amount: float64}");
    CHECK(to_string(*joined) == "join(names, amounts, 'id', 'id')");
}

TEST_CASE("node: join with differently named keys", "[node]") {
    auto names = table("names", "var * {id: int64, name: string}");
    auto amounts = table("amounts", "var * {person: int64, amount: float64}");
    auto joined = ok(join(names, amounts, "id", "person"));
    CHECK(columns(*joined).value() == std::vector<std::string>{"id", "name", "amount"});
}

TEST_CASE("node: join construction errors", "[node]") {
    auto names = table("names", "var * {id: int64, name: string}");
    auto amounts = table("amounts", "var * {id: int32, amount: float64}");
    auto clashing = table("clashing", "var * {id: int64, name: string}");

    auto mismatch = join(names, amounts, "id");
    REQUIRE_FALSE(mismatch.has_value());
    CHECK(mismatch.error().kind == ErrorKind::JoinKeyMismatch);

    auto unknown = join(names, clashing, "nope");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind == ErrorKind::UnknownColumn);

    auto duplicate = join(names, clashing, "id");
    REQUIRE_FALSE(duplicate.has_value());
    CHECK(duplicate.error().kind == ErrorKind::DuplicateField);
}

// ─── Structural identity ─────────────────────────────────────────────────────

TEST_CASE("node: structurally equal trees hash alike", "[node]") {
    auto build = [] {
        auto t = table("t", "var * {a: int32, b: string}");
        return ok(column(ok(selection(t, positive(t, "a"))), "b"));
    };
    auto lhs = build();
    auto rhs = build();
    CHECK(lhs != rhs);
    CHECK(structural_equal(*lhs, *rhs));
    CHECK(structural_hash(*lhs) == structural_hash(*rhs));

    auto t = table("t", "var * {a: int32, b: string}");
    CHECK_FALSE(structural_equal(*lhs, *ok(column(t, "b"))));
    CHECK_FALSE(structural_equal(*t, *table("u", "var * {a: int32, b: string}")));
}

TEST_CASE("node: factories store the structural hash", "[node]") {
    auto t = table("t", "var * {a: int32, b: string}");
    auto expr = ok(column(ok(selection(t, positive(t, "a"))), "b"));
    CHECK(expr->hash != 0);

    auto uncached = Expr{.node = expr->node};
    REQUIRE(uncached.hash == 0);
    CHECK(structural_hash(uncached) == expr->hash);
    CHECK(structural_equal(uncached, *expr));
}

TEST_CASE("node: schema is deterministic", "[node]") {
    auto t = table("t", "var * {name: string, amount: float64}");
    auto grouped = ok(by(t, ok(column(t, "name")),
                         ok(reduction(ReductionKind::Sum, ok(column(t, "amount"))))));
    auto first = schema(*grouped);
    auto second = schema(*grouped);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
}

TEST_CASE("node: kind names", "[node]") {
    CHECK(kind_name(ExprKind::ColumnWise) == "columnwise");
    CHECK(kind_name(ExprKind::Join) == "join");
    CHECK(reduction_name(ReductionKind::NUnique) == "nunique");
}
