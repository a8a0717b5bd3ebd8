#include <gtest/gtest.h>
#include <cellexpr/address.hpp>
#include <cellexpr/errors.hpp>

namespace {

using namespace cellexpr;

TEST(Address, ColumnLetters) {
    EXPECT_EQ(column_index("A"), 1);
    EXPECT_EQ(column_index("Z"), 26);
    EXPECT_EQ(column_index("AA"), 27);
    EXPECT_EQ(column_index("zz"), 702);
    EXPECT_EQ(column_index("A1"), 0);
    EXPECT_EQ(column_name(28), "AB");
    EXPECT_EQ(column_name(0), "");
}

TEST(Address, RoundTripUpToThreeLetters) {
    for (std::int64_t col = 1; col <= 18278; ++col) {
        ASSERT_EQ(column_index(column_name(col)), col);
        Position p;
        p.column = col;
        p.row = col % 97 + 1;
        p.absolute_column = col % 2 == 0;
        p.absolute_row = col % 3 == 0;
        ASSERT_EQ(decode(encode(p)), p) << encode(p);
    }
    EXPECT_EQ(column_name(18278), "ZZZ");
}

TEST(Address, DecodeFlags) {
    Position p = decode("$B$12");
    EXPECT_EQ(p.column, 2);
    EXPECT_EQ(p.row, 12);
    EXPECT_TRUE(p.absolute_column);
    EXPECT_TRUE(p.absolute_row);

    Position q = decode("ab3");
    EXPECT_EQ(q.column, 28);
    EXPECT_FALSE(q.absolute_column);
    EXPECT_EQ(encode(q), "AB3");
}

TEST(Address, DecodeRejectsMalformed) {
    EXPECT_THROW(decode(""), AddressError);
    EXPECT_THROW(decode("12"), AddressError);
    EXPECT_THROW(decode("A"), AddressError);
    EXPECT_THROW(decode("$"), AddressError);
    EXPECT_THROW(decode("A1B"), AddressError);
    EXPECT_THROW(decode("A99999999999999999999"), AddressError);
    EXPECT_THROW(decode("ABCDEFGHIJK1"), AddressError);
    EXPECT_FALSE(try_decode("sum").has_value());
    EXPECT_TRUE(try_decode("Sheet1").has_value());
}

TEST(Address, AddressErrorIsParseError) {
    EXPECT_THROW(decode("?"), ParseError);
}

TEST(Address, QualifiedNames) {
    Position p = decode_qualified("'My Sheet'!C4");
    EXPECT_EQ(p.sheet, "My Sheet");
    EXPECT_EQ(p.column, 3);
    EXPECT_EQ(p.row, 4);
    EXPECT_EQ(encode(p), "My Sheet!C4");

    EXPECT_EQ(decode_qualified("Data!$A1").sheet, "Data");
    EXPECT_TRUE(decode_qualified("A1").sheet.empty());
    EXPECT_THROW(decode_qualified("!A1"), AddressError);
}

TEST(Address, EncodeRange) {
    Range r{decode("A1"), decode("B2")};
    EXPECT_EQ(encode(r), "A1:B2");
    EXPECT_EQ(encode(Range{decode("C3"), decode("C3")}), "C3");
    EXPECT_EQ(encode(Range{decode("C3"), decode("$C$3")}), "C3:$C$3");
    EXPECT_EQ(encode(Position{}), "");
}

TEST(Address, NormalizeIsOrderIndependent) {
    Range a = Range{decode("B3"), decode("A1")}.normalize();
    Range b = Range{decode("A1"), decode("B3")}.normalize();
    Range c = Range{decode("A3"), decode("B1")}.normalize();
    EXPECT_EQ(a.start, b.start);
    EXPECT_EQ(a.end, b.end);
    EXPECT_EQ(c.start, b.start);
    EXPECT_EQ(c.end, b.end);
    EXPECT_EQ(b.width(), 1);
    EXPECT_EQ(b.height(), 2);
    EXPECT_TRUE(a.contains(decode("B2")));
    EXPECT_FALSE(a.contains(decode("C2")));
}

TEST(Address, OffsetShiftsRelativeParts) {
    EXPECT_EQ(encode(offset(decode("A2"), 1, 1)), "B3");
    EXPECT_EQ(encode(offset(decode("$A$2"), 1, 1)), "$A$2");
    EXPECT_EQ(encode(offset(decode("$A2"), 1, 1)), "$A3");
    EXPECT_EQ(encode(offset(decode("A$2"), 1, 1)), "B$2");
    EXPECT_EQ(encode(offset(decode("C5"), -2, -1)), "B3");
}

} // namespace
