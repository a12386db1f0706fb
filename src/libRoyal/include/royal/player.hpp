#pragma once

#include "royal/board.hpp"
#include "royal/position.hpp"
#include "royal/tile.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace royal {

//! Participant of a match with its own board and score.
class Player {
public:
	explicit Player(std::string name);

	const std::string& name() const;
	unsigned score() const;
	std::size_t tilesPlaced() const;              //!< Tiles placed after the start tile.
	const std::optional<Tile>& startTile() const; //!< Start tile if already placed.

	Board& board();
	const Board& board() const;

	void addScore(unsigned points);

	//! Place the start tile at the origin (0,0) of the board.
	void placeStartTile(const Tile& tile);

	//! Place a tile on the own board and count it. Throws RuleError(PositionOccupied) if the field is taken.
	void placeTile(Position pos, const Tile& tile);

private:
	std::string m_name;
	unsigned m_score{0};
	std::size_t m_tilesPlaced{0};
	std::optional<Tile> m_startTile{};
	Board m_board{};
};

} // namespace royal
