#include "royal/position.hpp"

#include <algorithm>
#include <cassert>
#include <format>

namespace royal {

BoundingBox BoundingBox::extended(const Position p) const {
	return {std::min(minRow, p.row), std::max(maxRow, p.row), std::min(minCol, p.col), std::max(maxCol, p.col)};
}

BoundingBox boundingBoxOf(const std::vector<Position>& positions) {
	assert(!positions.empty());

	BoundingBox box{positions.front().row, positions.front().row, positions.front().col, positions.front().col};
	for (const auto p: positions) {
		box = box.extended(p);
	}
	return box;
}

std::string toString(const Position p) {
	return std::format("({},{})", p.row, p.col);
}

} // namespace royal
