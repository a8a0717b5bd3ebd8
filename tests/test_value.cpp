#include <gtest/gtest.h>
#include <cellexpr/errors.hpp>
#include <cellexpr/value.hpp>

namespace {

using namespace cellexpr;

TEST(Value, Display) {
    EXPECT_EQ(display(Value::number(2)), "2");
    EXPECT_EQ(display(Value::number(0.5)), "0.5");
    EXPECT_EQ(display(Value::number(1.0 / 3.0)), "0.333333333333333");
    EXPECT_EQ(display(Value::boolean(true)), "true");
    EXPECT_EQ(display(Value::text("abc")), "abc");
    EXPECT_EQ(display(Value{}), "");
    EXPECT_EQ(display(Value(Array(2, 2))), "");
}

TEST(Value, ErrorDisplay) {
    EXPECT_EQ(display(Value::error(ErrorCode::Null)), "#NULL!");
    EXPECT_EQ(display(Value::error(ErrorCode::Div0)), "#DIV/0!");
    EXPECT_EQ(display(Value::error(ErrorCode::Value)), "#VALUE!");
    EXPECT_EQ(display(Value::error(ErrorCode::Ref)), "#REF!");
    EXPECT_EQ(display(Value::error(ErrorCode::Name)), "#NAME?");
    EXPECT_EQ(display(Value::error(ErrorCode::Num)), "#NUM!");
    EXPECT_EQ(display(Value::error(ErrorCode::NA)), "#N/A");
}

TEST(Value, DateDisplay) {
    EXPECT_EQ(display(Value(Date{0})), "1970-01-01");
    EXPECT_EQ(display(Value(Date{86400 * 365})), "1971-01-01");
    EXPECT_EQ(display(Value(Date{-1})), "1969-12-31");
    EXPECT_EQ(display(Value(Date{951782400})), "2000-02-29");
}

TEST(Value, KindAndTypeName) {
    EXPECT_EQ(kind(Value::number(1)), ValueKind::Scalar);
    EXPECT_EQ(kind(Value::error(ErrorCode::NA)), ValueKind::Error);
    EXPECT_EQ(kind(Value(Array(1, 1))), ValueKind::Array);
    EXPECT_EQ(type_name(Value{}), "blank");
    EXPECT_EQ(type_name(Value::number(1)), "number");
    EXPECT_EQ(type_name(Value::text("x")), "text");
    EXPECT_EQ(type_name(Value::boolean(false)), "boolean");
    EXPECT_EQ(type_name(Value(Date{0})), "date");
    EXPECT_EQ(type_name(Value(Array(2, 3))), "array(2, 3)");
}

TEST(Value, ToNumber) {
    EXPECT_DOUBLE_EQ(to_number(Value::text("12.5")).as<Number>()->v, 12.5);
    EXPECT_DOUBLE_EQ(to_number(Value::boolean(true)).as<Number>()->v, 1.0);
    EXPECT_DOUBLE_EQ(to_number(Value{}).as<Number>()->v, 0.0);
    EXPECT_DOUBLE_EQ(to_number(Value(Date{60})).as<Number>()->v, 60.0);
    EXPECT_EQ(to_number(Value::text("abc")).as<Error>()->code, ErrorCode::NA);
    EXPECT_EQ(to_number(Value::text("")).as<Error>()->code, ErrorCode::NA);
    EXPECT_EQ(to_number(Value(Array(1, 1))).as<Error>()->code, ErrorCode::Value);
    EXPECT_EQ(to_number(Value::error(ErrorCode::Ref)).as<Error>()->code, ErrorCode::Ref);
}

TEST(Value, ToTextAndBool) {
    EXPECT_EQ(to_text(Value::number(3)).as<Text>()->v, "3");
    EXPECT_EQ(to_text(Value::boolean(false)).as<Text>()->v, "false");
    EXPECT_EQ(to_text(Value(Array(1, 1))).as<Error>()->code, ErrorCode::Value);
    EXPECT_EQ(to_text(Value::error(ErrorCode::Num)).as<Error>()->code, ErrorCode::Num);

    EXPECT_TRUE(to_bool(Value::number(2)).as<Boolean>()->v);
    EXPECT_FALSE(to_bool(Value::number(0)).as<Boolean>()->v);
    EXPECT_TRUE(to_bool(Value::text("x")).as<Boolean>()->v);
    EXPECT_FALSE(to_bool(Value{}).as<Boolean>()->v);
    EXPECT_EQ(to_bool(Value(Array(1, 1))).as<Error>()->code, ErrorCode::Value);
}

TEST(Value, Comparison) {
    EXPECT_EQ(equal(Value::number(1), Value::number(1)), std::optional<bool>(true));
    EXPECT_EQ(less(Value::number(1), Value::number(2)), std::optional<bool>(true));
    EXPECT_EQ(less(Value::text("a"), Value::text("b")), std::optional<bool>(true));
    EXPECT_EQ(less(Value::boolean(false), Value::boolean(true)), std::optional<bool>(true));
    EXPECT_EQ(less(Value::boolean(true), Value::boolean(false)), std::optional<bool>(false));
    EXPECT_EQ(equal(Value{}, Value{}), std::optional<bool>(true));
    EXPECT_EQ(less(Value{}, Value{}), std::optional<bool>(false));
    EXPECT_FALSE(equal(Value::number(1), Value::text("1")).has_value());
    EXPECT_FALSE(less(Value(Array(1, 1)), Value(Array(1, 1))).has_value());
}

TEST(Array, BoundsChecked) {
    Array a(2, 3);
    EXPECT_EQ(a.rows(), 2u);
    EXPECT_EQ(a.columns(), 3u);
    EXPECT_TRUE(a.get(1, 2).is<Blank>());

    a.set(1, 2, Value::number(7));
    EXPECT_DOUBLE_EQ(a.get(1, 2).as<Number>()->v, 7.0);

    EXPECT_THROW(a.get(2, 0), EvalError);
    EXPECT_THROW(a.set(0, 3, Value::number(1)), EvalError);
    EXPECT_THROW(a.set(0, 0, Value(Array(1, 1))), EvalError);
}

TEST(Array, SizeIsCapped) {
    EXPECT_THROW(Array(std::size_t{1} << 62, 4), EvalError);
    EXPECT_THROW(Array(Array::max_cells + 1, 1), EvalError);
    EXPECT_THROW(Array(2, Array::max_cells), EvalError);

    Array wide(1, 4096);
    EXPECT_EQ(wide.cells().size(), 4096u);
    Array none(0, 5);
    EXPECT_TRUE(none.empty());
}

TEST(Array, ApplyInPlace) {
    Array a(1, 3);
    for (std::size_t c = 0; c < 3; ++c) a.set(0, c, Value::number(static_cast<double>(c + 1)));
    a.apply([](const Value& v) { return Value::number(v.as<Number>()->v * 10); });
    EXPECT_DOUBLE_EQ(a.get(0, 2).as<Number>()->v, 30.0);

    EXPECT_THROW(a.apply([](const Value&) -> Value { throw EvalError("stop"); }), EvalError);
}

TEST(Array, ApplyWithBroadcasts) {
    Array col(2, 1);
    col.set(0, 0, Value::number(1));
    col.set(1, 0, Value::number(2));
    Array row(1, 3);
    for (std::size_t c = 0; c < 3; ++c) row.set(0, c, Value::number(static_cast<double>(10 * (c + 1))));

    Array sum = col.apply_with(row, [](const Value& a, const Value& b) {
        return Value::number(a.as<Number>()->v + b.as<Number>()->v);
    });
    ASSERT_EQ(sum.rows(), 2u);
    ASSERT_EQ(sum.columns(), 3u);
    EXPECT_DOUBLE_EQ(sum.get(0, 0).as<Number>()->v, 11.0);
    EXPECT_DOUBLE_EQ(sum.get(1, 2).as<Number>()->v, 32.0);

    Array one(1, 1);
    one.set(0, 0, Value::number(5));
    Array scaled = col.apply_with(one, [](const Value& a, const Value& b) {
        return Value::number(a.as<Number>()->v * b.as<Number>()->v);
    });
    ASSERT_EQ(scaled.rows(), 2u);
    ASSERT_EQ(scaled.columns(), 1u);
    EXPECT_DOUBLE_EQ(scaled.get(1, 0).as<Number>()->v, 10.0);
}

} // namespace
