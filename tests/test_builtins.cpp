#include <gtest/gtest.h>
#include <cellexpr/builtins.hpp>
#include <cellexpr/eval.hpp>
#include <cellexpr/grid_stub.hpp>
#include <cellexpr/parser.hpp>

#include <string>

namespace {

using namespace cellexpr;

struct Book {
    MemoryWorkbook wb;
    Environment env;
    WorkbookScope scope{wb, &env};

    Book() {
        register_builtins(env);
        MemorySheet& s = wb.add_sheet("Sheet1");
        for (int i = 1; i <= 5; ++i) s.set("A" + std::to_string(i), Value::number(i));
        s.set("B1", Value::text("x"));
        s.set("B2", Value::boolean(true));
        s.set("B4", Value::number(7));
    }

    Value eval(const std::string& text) { return evaluate(*parse(text), scope); }
    std::string show(const std::string& text) { return display(eval(text)); }
};

TEST(Builtins, Aggregates) {
    Book b;
    EXPECT_EQ(b.show("sum(1, 2, 3)"), "6");
    EXPECT_EQ(b.show("sum(A1:A5)"), "15");
    EXPECT_EQ(b.show("sum(A1:B5)"), "22");
    EXPECT_EQ(b.show("sum()"), "0");
    EXPECT_EQ(b.show("avg(A1:A5)"), "3");
    EXPECT_EQ(b.show("average(2, 3)"), "2.5");
    EXPECT_EQ(b.show("min(A1:A5, 0)"), "0");
    EXPECT_EQ(b.show("max(A1:B5)"), "7");
    EXPECT_EQ(b.show("count(A1:B5)"), "6");
    EXPECT_EQ(b.show("count(1, 'a', '2')"), "2");
    EXPECT_EQ(b.show("SUM(A1:A2)"), "3");
}

TEST(Builtins, AggregatesPropagateErrors) {
    Book b;
    EXPECT_EQ(b.show("sum(1/0, 1)"), "#DIV/0!");
    EXPECT_EQ(b.show("sum('abc')"), "#VALUE!");
    EXPECT_EQ(b.show("max(A1:A5 / 0)"), "#DIV/0!");
}

TEST(Builtins, Rounding) {
    Book b;
    EXPECT_EQ(b.show("round(2.5)"), "3");
    EXPECT_EQ(b.show("round(-2.5)"), "-3");
    EXPECT_EQ(b.show("round(1.2345, 2)"), "1.23");
    EXPECT_EQ(b.show("rounddown(1.99)"), "1");
    EXPECT_EQ(b.show("rounddown(-1.5)"), "-1");
    EXPECT_EQ(b.show("roundup(1.01)"), "2");
    EXPECT_EQ(b.show("roundup(-1.5)"), "-2");
    EXPECT_EQ(b.show("sqrt(16)"), "4");
    EXPECT_EQ(b.show("sqrt(-1)"), "#NUM!");
}

TEST(Builtins, ArgumentCounts) {
    Book b;
    EXPECT_EQ(b.show("sqrt()"), "#VALUE!");
    EXPECT_EQ(b.show("sqrt(1, 2)"), "#VALUE!");
    EXPECT_EQ(b.show("mid('abc', 1)"), "#VALUE!");
    EXPECT_EQ(b.show("countif()"), "#VALUE!");
}

TEST(Builtins, Types) {
    Book b;
    EXPECT_EQ(b.show("typeof(1)"), "number");
    EXPECT_EQ(b.show("typeof('x')"), "text");
    EXPECT_EQ(b.show("typeof(A1:B2)"), "array(2, 2)");
    EXPECT_EQ(b.show("typeof(Z9)"), "blank");
    EXPECT_EQ(b.show("typeof(1/0)"), "error");
    EXPECT_EQ(b.show("typeof(now())"), "date");
    EXPECT_EQ(b.show("isnumber(A1)"), "true");
    EXPECT_EQ(b.show("isnumber(B1)"), "false");
    EXPECT_EQ(b.show("istext(B1)"), "true");

    Value r = b.eval("rand()");
    ASSERT_TRUE(r.is<Number>());
    EXPECT_GE(r.as<Number>()->v, 0.0);
    EXPECT_LT(r.as<Number>()->v, 1.0);
}

TEST(Builtins, Text) {
    Book b;
    EXPECT_EQ(b.show("left('hello', 2)"), "he");
    EXPECT_EQ(b.show("left('hello')"), "h");
    EXPECT_EQ(b.show("right('hello', 3)"), "llo");
    EXPECT_EQ(b.show("right('hi', 5)"), "hi");
    EXPECT_EQ(b.show("mid('hello', 2, 3)"), "ell");
    EXPECT_EQ(b.show("mid('hello', 9, 3)"), "");
    EXPECT_EQ(b.show("substr('hello', 3)"), "llo");
    EXPECT_EQ(b.show("len('hello')"), "5");
    EXPECT_EQ(b.show("upper('MiXed')"), "MIXED");
    EXPECT_EQ(b.show("lower('MiXed')"), "mixed");
    EXPECT_EQ(b.show("replace('hello', 1, 1, 'J')"), "Jello");
    EXPECT_EQ(b.show("concat('a', 1, true)"), "a1true");
    EXPECT_EQ(b.show("concat(A1:A3)"), "123");
    EXPECT_EQ(b.show("left('abc', -1)"), "#VALUE!");
}

TEST(Builtins, HugeCountsClamp) {
    Book b;
    EXPECT_EQ(b.show("left('abc', 1000000000000000000000000000000)"), "abc");
    EXPECT_EQ(b.show("right('abc', 1000000000000000000000000000000)"), "abc");
    EXPECT_EQ(b.show("mid('abc', 2, 1000000000000000000000000000000)"), "bc");
    EXPECT_EQ(b.show("mid('abc', 1000000000000000000000000000000, 1)"), "");
    EXPECT_EQ(b.show("substr('abc', 18446744073709551616)"), "");
    EXPECT_EQ(b.show("replace('abc', 2, 1000000000000000000000000000000, 'Z')"), "aZ");
}

TEST(Builtins, Logic) {
    Book b;
    EXPECT_EQ(b.show("if(1 > 2, 'y', 'n')"), "n");
    EXPECT_EQ(b.show("if(A1, 'y', 'n')"), "y");
    EXPECT_EQ(b.show("if(false, 1)"), "false");
    EXPECT_EQ(b.show("if(1/0, 1, 2)"), "#DIV/0!");
    EXPECT_EQ(b.show("and(true, false)"), "false");
    EXPECT_EQ(b.show("and(A1:A5)"), "true");
    EXPECT_EQ(b.show("or(false, 1)"), "true");
    EXPECT_EQ(b.show("xor(true, true)"), "false");
    EXPECT_EQ(b.show("xor(true, false, false)"), "true");
    EXPECT_EQ(b.show("not(false)"), "true");
    EXPECT_EQ(b.show("NOT(TRUE)"), "false");
}

TEST(Builtins, Reducers) {
    Book b;
    EXPECT_EQ(b.show("countif(A1:A5 > 2)"), "3");
    EXPECT_EQ(b.show("countif(A1:A5)"), "5");
    EXPECT_EQ(b.show("countif(A1:A5, 3)"), "1");
    EXPECT_EQ(b.show("countif(B1:B5 = 'x')"), "1");
    EXPECT_EQ(b.show("sumif(A1:A5 >= 4)"), "9");
    EXPECT_EQ(b.show("sumif(A1:B5 > 4)"), "12");
    EXPECT_EQ(b.show("averageif(A1:A5 < 3)"), "1.5");
    EXPECT_EQ(b.show("averageif(A1:A5 > 10)"), "#DIV/0!");
    EXPECT_EQ(b.show("any(A1:A5 > 4)"), "true");
    EXPECT_EQ(b.show("any(A1:A5 > 5)"), "false");
    EXPECT_EQ(b.show("all(A1:A5 > 0)"), "true");
    EXPECT_EQ(b.show("all(A1:A5 > 1)"), "false");
    EXPECT_EQ(b.show("COUNTIF(A1:A5 <> 3)"), "4");
    EXPECT_EQ(b.show("countif(A1:A5 > 1/0)"), "#DIV/0!");
}

} // namespace
