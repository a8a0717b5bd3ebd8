#include <gtest/gtest.h>
#include <cellexpr/builtins.hpp>
#include <cellexpr/errors.hpp>
#include <cellexpr/eval.hpp>
#include <cellexpr/grid_stub.hpp>
#include <cellexpr/parser.hpp>

#include <string>
#include <vector>

namespace {

using namespace cellexpr;

struct Sheet {
    MemoryWorkbook wb;
    Environment env;
    WorkbookScope scope{wb, &env};

    Sheet() {
        register_builtins(env);
        env.define("one", make_function("one", [](const std::vector<Value>&) { return Value::number(1); }, 0, 0));
        env.define("x", Value::number(10));
        MemorySheet& s = wb.add_sheet("Sheet1");
        s.set("B1", Value::text("foo"));
        s.set("B2", Value::text("bar"));
        s.set("A1", Value::number(1));
        s.set("A2", Value::number(2));
        s.set("A3", Value::number(3));
    }

    Value eval(const std::string& text) { return evaluate(*parse(text), scope); }
    std::string show(const std::string& text) { return display(eval(text)); }
    ErrorCode error(const std::string& text) {
        Value v = eval(text);
        const Error* e = v.as<Error>();
        if (!e) ADD_FAILURE() << text << " gave " << display(v);
        return e ? e->code : ErrorCode::NA;
    }
};

TEST(Eval, Literals) {
    Sheet s;
    EXPECT_EQ(s.show("1+1"), "2");
    EXPECT_EQ(s.show("'foo' & 'bar'"), "foobar");
    EXPECT_EQ(s.show("\"a\" & 1"), "a1");
    EXPECT_EQ(s.show("one()"), "1");
    EXPECT_EQ(s.show("x * 2"), "20");
}

TEST(Eval, Arithmetic) {
    Sheet s;
    EXPECT_EQ(s.show("1+1*2"), "3");
    EXPECT_EQ(s.show("(1+1)*2"), "4");
    EXPECT_EQ(s.show("2^3^2"), "512");
    EXPECT_EQ(s.show("-2^2"), "4");
    EXPECT_EQ(s.show("7/2"), "3.5");
    EXPECT_EQ(s.show("true + 1"), "2");
}

TEST(Eval, SignNeedsANumber) {
    Sheet s;
    EXPECT_EQ(s.show("-A3"), "-3");
    EXPECT_EQ(s.show("+A2"), "2");
    EXPECT_EQ(s.error("-'3'"), ErrorCode::Value);
    EXPECT_EQ(s.error("+'3'"), ErrorCode::Value);
    EXPECT_EQ(s.error("-true"), ErrorCode::Value);
    EXPECT_EQ(s.error("-Z99"), ErrorCode::Value);
    EXPECT_EQ(s.error("-B1"), ErrorCode::Value);
    EXPECT_EQ(s.error("-now()"), ErrorCode::Value);
    EXPECT_EQ(s.error("-(1/0)"), ErrorCode::Div0);

    Value mixed = s.eval("-A1:B1");
    EXPECT_DOUBLE_EQ(mixed.as<Array>()->get(0, 0).as<Number>()->v, -1.0);
    EXPECT_EQ(mixed.as<Array>()->get(0, 1).as<Error>()->code, ErrorCode::Value);
}

TEST(Eval, CellReferences) {
    Sheet s;
    EXPECT_EQ(s.show("$B$1 & B2"), "foobar");
    EXPECT_EQ(s.show("A1 + A2 + A3"), "6");
    EXPECT_EQ(s.show("Sheet1!A3 * 2"), "6");
    EXPECT_TRUE(s.eval("Z99").is<Blank>());
    EXPECT_EQ(s.show("Z99 + 1"), "1");
}

TEST(Eval, Comparisons) {
    Sheet s;
    EXPECT_EQ(s.show("1 < 2"), "true");
    EXPECT_EQ(s.show("1 >= 1"), "true");
    EXPECT_EQ(s.show("1 <= 1"), "true");
    EXPECT_EQ(s.show("1 > 1"), "false");
    EXPECT_EQ(s.show("2 > 1"), "true");
    EXPECT_EQ(s.show("true <> false"), "true");
    EXPECT_EQ(s.show("'a' = 'a'"), "true");
    EXPECT_EQ(s.show("'a' < 'b'"), "true");
}

TEST(Eval, InLanguageErrors) {
    Sheet s;
    EXPECT_EQ(s.error("1/0"), ErrorCode::Div0);
    EXPECT_EQ(s.show("1/0"), "#DIV/0!");
    EXPECT_EQ(s.error("(-1)^0.5"), ErrorCode::Num);
    EXPECT_EQ(s.error("1 + 'abc'"), ErrorCode::Value);
    EXPECT_EQ(s.error("-'abc'"), ErrorCode::Value);
    EXPECT_EQ(s.error("'a' < 1"), ErrorCode::Value);
    EXPECT_EQ(s.error("nope(1)"), ErrorCode::Name);
    EXPECT_EQ(s.error("Nowhere!A1"), ErrorCode::Ref);
}

TEST(Eval, ErrorsPropagateLeftFirst) {
    Sheet s;
    EXPECT_EQ(s.error("1/0 + 'x' * 2"), ErrorCode::Div0);
    EXPECT_EQ(s.error("(1/0) & nope()"), ErrorCode::Div0);
    EXPECT_EQ(s.error("nope() + 1/0"), ErrorCode::Name);
    EXPECT_EQ(s.error("-(1/0)"), ErrorCode::Div0);
}

TEST(Eval, StructuralErrorsThrow) {
    Sheet s;
    EXPECT_THROW(s.eval("undefined_name + 1"), UndefinedError);
    EXPECT_THROW(s.eval("x(1)"), NotCallableError);

    Environment bare;
    EXPECT_THROW(evaluate(*parse("A1"), bare), NotAvailableError);
}

TEST(Eval, RangesAreArrays) {
    Sheet s;
    Value v = s.eval("A1:B2");
    const Array* a = v.as<Array>();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->rows(), 2u);
    EXPECT_EQ(a->columns(), 2u);
    EXPECT_DOUBLE_EQ(a->get(1, 0).as<Number>()->v, 2.0);
    EXPECT_EQ(a->get(0, 1).as<Text>()->v, "foo");
    EXPECT_EQ(type_name(v), "array(2, 2)");
}

TEST(Eval, RangeCornerOrderDoesNotMatter) {
    Sheet s;
    for (const char* text : {"B2:A1", "A2:B1", "B1:A2"}) {
        Value v = s.eval(text);
        const Array* a = v.as<Array>();
        ASSERT_NE(a, nullptr) << text;
        EXPECT_EQ(a->rows(), 2u);
        EXPECT_EQ(a->columns(), 2u);
        EXPECT_DOUBLE_EQ(a->get(0, 0).as<Number>()->v, 1.0) << text;
        EXPECT_EQ(a->get(1, 1).as<Text>()->v, "bar") << text;
    }
}

TEST(Eval, ArrayArithmetic) {
    Sheet s;
    Value twice = s.eval("A1:A3 * 2");
    const Array* a = twice.as<Array>();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->rows(), 3u);
    EXPECT_DOUBLE_EQ(a->get(2, 0).as<Number>()->v, 6.0);

    Value sum = s.eval("A1:A3 + A1:A3");
    EXPECT_DOUBLE_EQ(sum.as<Array>()->get(1, 0).as<Number>()->v, 4.0);

    Value neg = s.eval("-A1:A3");
    EXPECT_DOUBLE_EQ(neg.as<Array>()->get(0, 0).as<Number>()->v, -1.0);

    Value mixed = s.eval("A1:B1 + 1");
    EXPECT_DOUBLE_EQ(mixed.as<Array>()->get(0, 0).as<Number>()->v, 2.0);
    EXPECT_EQ(mixed.as<Array>()->get(0, 1).as<Error>()->code, ErrorCode::Value);
}

TEST(Eval, CalleeMustBeAName) {
    Sheet s;
    std::vector<ExprPtr> args;
    args.push_back(make_number(2));
    auto call = make_call(make_number(1), std::move(args));
    Value v = evaluate(*call, s.scope);
    ASSERT_NE(v.as<Error>(), nullptr);
    EXPECT_EQ(v.as<Error>()->code, ErrorCode::Name);
}

TEST(Eval, MovedOffTheSheetIsRef) {
    Sheet s;
    auto moved = clone_with_offset(*parse("A1 + 1"), -1, 0);
    Value v = evaluate(*moved, s.scope);
    ASSERT_NE(v.as<Error>(), nullptr);
    EXPECT_EQ(v.as<Error>()->code, ErrorCode::Ref);
}

TEST(Eval, ArgumentsAreLazy) {
    Sheet s;
    auto e = parse("A1:A3 > 1");
    Argument arg(*e);
    auto split = arg.try_as_predicate(s.scope);
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(type_name(split->first), "array(3, 1)");
    EXPECT_TRUE(split->second.test(Value::number(2)));
    EXPECT_FALSE(split->second.test(Value::number(1)));
    EXPECT_FALSE(split->second.test(Value::text("x")));

    auto plain = parse("A1 + 1");
    EXPECT_FALSE(Argument(*plain).try_as_predicate(s.scope).has_value());
    EXPECT_FALSE(Argument(Value::number(1)).try_as_predicate(s.scope).has_value());
    EXPECT_EQ(display(Argument(Value::number(4)).eval(s.scope)), "4");

    Predicate always;
    EXPECT_TRUE(always.test(Value{}));
}

} // namespace
