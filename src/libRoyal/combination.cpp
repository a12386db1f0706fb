#include "royal/combination.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

namespace royal {

Combination::Combination(std::vector<Position> positions, std::vector<Position> flippablePositions)
    : m_positions{std::move(positions)}, m_flippable{std::move(flippablePositions)} {
	std::sort(m_positions.begin(), m_positions.end());
	assert(std::all_of(m_flippable.begin(), m_flippable.end(), [&](Position p) { return contains(p); }));
}

const std::vector<Position>& Combination::positions() const {
	return m_positions;
}

const std::vector<Position>& Combination::flippablePositions() const {
	return m_flippable;
}

std::size_t Combination::size() const {
	return m_positions.size();
}

bool Combination::contains(const Position pos) const {
	return std::binary_search(m_positions.begin(), m_positions.end(), pos);
}

bool Combination::isFlippable(const Position pos) const {
	return std::find(m_flippable.begin(), m_flippable.end(), pos) != m_flippable.end();
}

} // namespace royal
