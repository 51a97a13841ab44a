#include "core/notation.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace ttt::gtest {

TEST(Notation, MarkFromString) {
	EXPECT_EQ(markFromString("X"), Mark::X);
	EXPECT_EQ(markFromString("O"), Mark::O);
	EXPECT_EQ(markFromString("x"), Mark::X);
	EXPECT_EQ(markFromString(" o "), Mark::O);

	EXPECT_FALSE(markFromString("").has_value());
	EXPECT_FALSE(markFromString("Z").has_value());
	EXPECT_FALSE(markFromString("0").has_value());
	EXPECT_FALSE(markFromString("XO").has_value());
}

TEST(Notation, MarkOrDefault) {
	EXPECT_EQ(markOrDefault("O"), Mark::O);
	EXPECT_EQ(markOrDefault("X"), Mark::X);
	EXPECT_EQ(markOrDefault("Z"), Mark::X);
	EXPECT_EQ(markOrDefault(""), Mark::X);
}

TEST(Notation, ToString) {
	EXPECT_EQ(toString(Mark::X), "X");
	EXPECT_EQ(toString(Mark::O), "O");
	EXPECT_EQ(toChar(Board::Cell::X), 'X');
	EXPECT_EQ(toChar(Board::Cell::O), 'O');
	EXPECT_EQ(toChar(Board::Cell::Empty), ' ');
}

TEST(Notation, ParseCoordValid) {
	const auto a = parseCoord("1,2");
	ASSERT_TRUE(a.has_value());
	EXPECT_EQ(a->row, 1u);
	EXPECT_EQ(a->col, 2u);

	const auto b = parseCoord(" 0 , 2 \n");
	ASSERT_TRUE(b.has_value());
	EXPECT_EQ(b->row, 0u);
	EXPECT_EQ(b->col, 2u);

	// Range is checked by the game, not the parser.
	const auto c = parseCoord("7,3");
	ASSERT_TRUE(c.has_value());
	EXPECT_EQ(c->row, 7u);
	EXPECT_EQ(c->col, 3u);
}

TEST(Notation, ParseCoordPlusSign) {
	const auto c = parseCoord("+1, +2");
	ASSERT_TRUE(c.has_value());
	EXPECT_EQ(c->row, 1u);
	EXPECT_EQ(c->col, 2u);

	EXPECT_FALSE(parseCoord("+,1").has_value());
	EXPECT_FALSE(parseCoord("++1,1").has_value());
	EXPECT_FALSE(parseCoord("+-1,1").has_value());
}

// Too large for an index is still a well formed number, so it stays a range problem.
TEST(Notation, ParseCoordHugeNumber) {
	const auto c = parseCoord("4294967296,0");
	ASSERT_TRUE(c.has_value());
	EXPECT_EQ(c->row, std::numeric_limits<Id>::max());
	EXPECT_EQ(c->col, 0u);
	EXPECT_FALSE(isOnBoard(*c));

	const auto d = parseCoord("1,99999999999999999999999");
	ASSERT_TRUE(d.has_value());
	EXPECT_FALSE(isOnBoard(*d));

	EXPECT_FALSE(parseCoord("99999999999999999999999x,1").has_value());
}

TEST(Notation, ParseCoordInvalid) {
	EXPECT_FALSE(parseCoord("").has_value());
	EXPECT_FALSE(parseCoord("1").has_value());
	EXPECT_FALSE(parseCoord("1,").has_value());
	EXPECT_FALSE(parseCoord(",1").has_value());
	EXPECT_FALSE(parseCoord("a,1").has_value());
	EXPECT_FALSE(parseCoord("1 1").has_value());
	EXPECT_FALSE(parseCoord("-1,0").has_value());
	EXPECT_FALSE(parseCoord("1,2,3").has_value());
	EXPECT_FALSE(parseCoord("1.5,2").has_value());
}

TEST(Notation, RenderEmptyBoard) {
	Board board;
	EXPECT_EQ(renderBoard(board), "  |   |  \n  |   |  \n  |   |  \n");
}

TEST(Notation, RenderBoard) {
	Board board;
	board.place({0u, 0u}, Board::Cell::X);
	board.place({1u, 1u}, Board::Cell::O);
	board.place({2u, 1u}, Board::Cell::X);

	EXPECT_EQ(renderBoard(board), "X |   |  \n  | O |  \n  | X |  \n");
}

} // namespace ttt::gtest
