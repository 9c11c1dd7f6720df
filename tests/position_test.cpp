#include "position.hpp"
#include <gtest/gtest.h>

using relex::Position;

TEST(Position, EndIsStartPlusLength) {
    Position p(4, 3);
    EXPECT_EQ(p.start(), 4);
    EXPECT_EQ(p.length(), 3);
    EXPECT_EQ(p.end(), 7);
    EXPECT_TRUE(p.is_valid());
}

TEST(Position, NegativeStartIsInvalid) {
    Position p(-1, 0);
    EXPECT_FALSE(p.is_valid());
    EXPECT_EQ(p.extract("anything"), "");
}

TEST(Position, ContainsIsReflexive) {
    Position outer(0, 10);
    Position inner(2, 3);
    EXPECT_TRUE(outer.contains(outer));
    EXPECT_TRUE(outer.contains(inner));
    EXPECT_FALSE(inner.contains(outer));
    EXPECT_TRUE(outer.contains(Position(5, 5)));
    EXPECT_FALSE(outer.contains(Position(5, 6)));
}

TEST(Position, AdjacentPositionsDoNotOverlap) {
    Position a(0, 5);
    EXPECT_FALSE(a.overlaps(Position(5, 3)));
    EXPECT_TRUE(a.overlaps(Position(4, 3)));
    EXPECT_TRUE(Position(4, 3).overlaps(a));
    EXPECT_FALSE(Position(8, 2).overlaps(a));
}

TEST(Position, Extract) {
    EXPECT_EQ(Position(4, 3).extract("abc 123 def"), "123");
    EXPECT_EQ(Position(0, 0).extract("abc"), "");
    // Start is a byte offset, length counts characters
    EXPECT_EQ(Position(1, 2).extract("h\xC3\xA9llo"), "\xC3\xA9l");
    EXPECT_EQ(Position(3, 3).extract("\xC3\xA9 123"), "123");
    EXPECT_EQ(Position(9, 1).extract("abc"), "");
}

TEST(Position, FromOffsetCapture) {
    Position p = Position::from_offset_capture(std::string("123"), 4);
    EXPECT_EQ(p, Position(4, 3));

    Position missing = Position::from_offset_capture(std::nullopt, -1);
    EXPECT_EQ(missing.start(), -1);
    EXPECT_EQ(missing.length(), 0);
    EXPECT_FALSE(missing.is_valid());

    Position negative = Position::from_offset_capture(std::string("x"), -1);
    EXPECT_FALSE(negative.is_valid());

    // Length is counted in characters
    Position utf = Position::from_offset_capture(std::string("h\xC3\xA9llo"), 2);
    EXPECT_EQ(utf.length(), 5);
}
