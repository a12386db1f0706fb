#pragma once

#include "royal/position.hpp"

#include <cstddef>
#include <vector>

namespace royal {

//! A scorable cluster together with the tiles that may be flipped when it is settled.
class Combination {
public:
	//! \param positions Cluster positions. Stored sorted by (row, col).
	//! \param flippablePositions Subset of positions that may be flipped, in selection order.
	Combination(std::vector<Position> positions, std::vector<Position> flippablePositions);

	const std::vector<Position>& positions() const;
	const std::vector<Position>& flippablePositions() const;
	std::size_t size() const;

	bool contains(Position pos) const;    //!< True if the position is part of the cluster.
	bool isFlippable(Position pos) const; //!< True if the position may be flipped when settling.

	bool operator==(const Combination&) const = default;

private:
	std::vector<Position> m_positions;
	std::vector<Position> m_flippable;
};

} // namespace royal
