#pragma once

#include "royal/board.hpp"
#include "royal/constants.hpp"

#include <array>

namespace royal {

//! Save format of a board: one code per cell relative to the top-left corner of the bounding box.
//! Empty cell: 990. Tile: color * 100 + symbol * 10 + flipped.
using BoardCode = std::array<std::array<int, BOARD_EXTENT>, BOARD_EXTENT>;

//! Cell code of a single tile.
int encodeTile(const Tile& tile);

//! Tile of a cell code. Throws RuleError(InvalidTileCode) if color or symbol is outside 1..6.
//! \note The cell must not be EMPTY_CELL_CODE.
Tile decodeTile(int code);

//! Encode the board into the save format.
BoardCode encode(const Board& board);

//! Build a board from the save format. Tiles are placed at (row, col) of their cell.
//! Throws RuleError(InvalidTileCode) on an invalid cell; no board is returned in that case.
Board decode(const BoardCode& code);

} // namespace royal
