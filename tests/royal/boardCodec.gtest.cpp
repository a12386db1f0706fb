#include "royal/boardCodec.hpp"
#include "royal/errors.hpp"

#include <gtest/gtest.h>

namespace royal::gtest {

static BoardCode emptyCode() {
	BoardCode code;
	for (auto& row: code) {
		row.fill(EMPTY_CELL_CODE);
	}
	return code;
}

TEST(BoardCodec, EncodeEmptyBoard) {
	EXPECT_EQ(encode(Board{}), emptyCode());
}

TEST(BoardCodec, EncodeRelativeToBoundingBox) {
	Board board;
	board.place({2, 3}, Tile(Color::Blue, Symbol::Bone));
	board.place({3, 5}, Tile(Color::Green, Symbol::Pug));
	board.place({6, 4}, Tile(Color::Yellow, Symbol::Pillow));
	board.flip({2, 3});

	auto expected  = emptyCode();
	expected[0][0] = 121;
	expected[1][2] = 260;
	expected[4][1] = 610;
	EXPECT_EQ(encode(board), expected);
}

TEST(BoardCodec, DecodeTiles) {
	auto code  = emptyCode();
	code[0][4] = 341;
	code[3][1] = 330;
	code[4][4] = 650;

	const auto board = decode(code);
	EXPECT_EQ(board.tileCount(), 3u);

	const auto* can = board.tileAt({0, 4});
	ASSERT_NE(can, nullptr);
	EXPECT_EQ(can->color(), Color::Orange);
	EXPECT_EQ(can->symbol(), Symbol::Can);
	EXPECT_TRUE(can->isFlipped());
	EXPECT_FALSE(can->hasCrown());

	const auto* bowl = board.tileAt({3, 1});
	ASSERT_NE(bowl, nullptr);
	EXPECT_FALSE(bowl->isFlipped());
	EXPECT_TRUE(bowl->hasCrown()); // Crown derived, not stored.

	const auto* poop = board.tileAt({4, 4});
	ASSERT_NE(poop, nullptr);
	EXPECT_TRUE(poop->hasCrown());
}

TEST(BoardCodec, RoundTrip) {
	Board board;
	board.place({0, 0}, Tile(Color::Blue, Symbol::Pillow));
	board.place({0, 1}, Tile(Color::Green, Symbol::Bone));
	board.place({1, 1}, Tile(Color::Orange, Symbol::Bowl));
	board.place({2, 0}, Tile(Color::Pink, Symbol::Can));
	board.place({4, 4}, Tile(Color::Purple, Symbol::Poop));
	board.place({3, 2}, Tile(Color::Yellow, Symbol::Pug));
	board.flip({1, 1});
	board.flip({4, 4});

	const auto code = encode(board);
	EXPECT_EQ(decode(code), board);
	EXPECT_EQ(encode(decode(code)), code);
}

TEST(BoardCodec, RoundTripTranslatesToOrigin) {
	Board board;
	board.place({-3, -2}, Tile(Color::Blue, Symbol::Bone));
	board.place({-2, -2}, Tile(Color::Blue, Symbol::Bowl));
	board.place({-2, -1}, Tile(Color::Blue, Symbol::Can));
	board.flip({-2, -1});

	Board expected;
	expected.place({0, 0}, Tile(Color::Blue, Symbol::Bone));
	expected.place({1, 0}, Tile(Color::Blue, Symbol::Bowl));
	expected.place({1, 1}, Tile(Color::Blue, Symbol::Can));
	expected.flip({1, 1});

	EXPECT_EQ(decode(encode(board)), expected);
}

TEST(BoardCodec, RejectInvalidCodes) {
	for (const int invalid: {710, 170, 100, 15, 0, -110}) {
		auto code  = emptyCode();
		code[0][0] = 110;
		code[2][2] = invalid;

		try {
			decode(code);
			ADD_FAILURE() << "Accepted cell code " << invalid;
		} catch (const RuleError& e) {
			EXPECT_EQ(e.type(), ErrorType::InvalidTileCode);
		}
	}
}

} // namespace royal::gtest
