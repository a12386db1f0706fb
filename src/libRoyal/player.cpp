#include "royal/player.hpp"

#include <utility>

namespace royal {

Player::Player(std::string name) : m_name{std::move(name)} {
}

const std::string& Player::name() const {
	return m_name;
}

unsigned Player::score() const {
	return m_score;
}

std::size_t Player::tilesPlaced() const {
	return m_tilesPlaced;
}

const std::optional<Tile>& Player::startTile() const {
	return m_startTile;
}

Board& Player::board() {
	return m_board;
}

const Board& Player::board() const {
	return m_board;
}

void Player::addScore(const unsigned points) {
	m_score += points;
}

void Player::placeStartTile(const Tile& tile) {
	m_board.place({0, 0}, tile);
	m_startTile = tile;
}

void Player::placeTile(const Position pos, const Tile& tile) {
	m_board.place(pos, tile);
	++m_tilesPlaced;
}

} // namespace royal
