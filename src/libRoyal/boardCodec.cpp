#include "royal/boardCodec.hpp"

#include "Logging.hpp"
#include "royal/errors.hpp"

#include <cassert>
#include <format>

namespace royal {

int encodeTile(const Tile& tile) {
	return toCode(tile.color()) * 100 + toCode(tile.symbol()) * 10 + (tile.isFlipped() ? 1 : 0);
}

Tile decodeTile(const int code) {
	assert(code != EMPTY_CELL_CODE);

	auto tile = Tile::fromCodes(code / 100, (code % 100) / 10);
	if (code % 10 == 1) {
		tile.flip();
	}
	return tile;
}

BoardCode encode(const Board& board) {
	BoardCode result;
	for (auto& row: result) {
		row.fill(EMPTY_CELL_CODE);
	}

	const auto snapshot = board.snapshot();
	for (std::size_t r = 0; r != snapshot.size(); ++r) {
		for (std::size_t c = 0; c != snapshot[r].size(); ++c) {
			if (snapshot[r][c]) {
				result[r][c] = encodeTile(*snapshot[r][c]);
			}
		}
	}
	return result;
}

Board decode(const BoardCode& code) {
	Board board;
	for (int r = 0; r != BOARD_EXTENT; ++r) {
		for (int c = 0; c != BOARD_EXTENT; ++c) {
			const auto cell = code[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)];
			if (cell == EMPTY_CELL_CODE)
				continue;

			try {
				board.place({r, c}, decodeTile(cell));
			} catch (const RuleError& e) {
				Logger().Log(Logging::LogLevel::Warning, std::format("[BoardCodec] Invalid cell code {} at {}.", cell, toString(Position{r, c})));
				throw RuleError(e.type(), std::format("code {} at cell {}", cell, toString(Position{r, c})));
			}
		}
	}
	return board;
}

} // namespace royal
