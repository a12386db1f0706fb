#pragma once

#include "royal/constants.hpp"
#include "royal/position.hpp"
#include "royal/tile.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace royal {

//! Dense view of the board relative to the top-left corner of its bounding box.
using Snapshot = std::array<std::array<std::optional<Tile>, BOARD_EXTENT>, BOARD_EXTENT>;

//! Sparse tile store of one player.
//! \note The 5x5 footprint is not checked on placement. Callers place only on positions from computeValidPositions(),
//!       except for the first tile of an empty board.
class Board {
public:
	Board() = default;

	//! Store a copy of the tile at the given position. Throws RuleError(PositionOccupied) if the field is taken.
	void place(Position pos, const Tile& tile);

	//! Toggle the flipped state of the tile at the given position. Throws RuleError(PositionEmpty) if there is no tile.
	void flip(Position pos);

	const Tile* tileAt(Position pos) const; //!< Tile at position or nullptr if empty.
	bool isOccupied(Position pos) const;    //!< True if a tile lies at the position.
	bool isEmpty(Position pos) const;       //!< True if no tile lies at the position.
	std::size_t tileCount() const;          //!< Number of placed tiles.
	std::size_t countFlipped() const;       //!< Number of flipped tiles.

	//! Occupied positions in placement order.
	const std::vector<Position>& positions() const;

	//! Empty positions orthogonally adjacent to a tile that keep the board within 5x5.
	//! Ordered by discovery: tiles in placement order, neighbours up, down, left, right. Empty for an empty board.
	std::vector<Position> computeValidPositions() const;

	std::optional<BoundingBox> boundingBox() const; //!< Box of all tiles. Empty for an empty board.
	std::optional<Position> snapshotOrigin() const; //!< Top-left corner of the bounding box.
	Snapshot snapshot() const;                      //!< Tiles relative to snapshotOrigin().

	bool operator==(const Board& other) const;

private:
	std::vector<Position> m_positions{};                 //!< Tile positions in placement order.
	std::vector<Tile> m_tiles{};                         //!< Tiles, same index as m_positions.
	std::unordered_map<Position, std::size_t> m_index{}; //!< Position -> index into m_tiles.
};

} // namespace royal
