#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace royal {

//! Grid coordinate of a tile. The grid is unbounded, negative values are valid.
struct Position {
	int row{0};
	int col{0};

	auto operator<=>(const Position&) const = default; //!< Orders by row, then column.
};

//! Row/column offset to a neighbouring field.
struct Offset {
	int dr, dc;
};

//! Up, down, left, right.
static constexpr std::array<Offset, 4> ORTHOGONAL{{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};
static constexpr std::array<Offset, 4> DIAGONAL{{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
//! All 8 neighbours in row-major order.
static constexpr std::array<Offset, 8> ALL_DIRECTIONS{{{-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}}};

inline constexpr Position operator+(const Position p, const Offset o) {
	return {p.row + o.dr, p.col + o.dc};
}

//! Sum of absolute row and column differences.
inline constexpr int manhattanDistance(const Position a, const Position b) {
	return (a.row > b.row ? a.row - b.row : b.row - a.row) + (a.col > b.col ? a.col - b.col : b.col - a.col);
}

//! Smallest axis-aligned rectangle containing a set of positions. Bounds are inclusive.
struct BoundingBox {
	int minRow, maxRow;
	int minCol, maxCol;

	int height() const {
		return maxRow - minRow + 1;
	}
	int width() const {
		return maxCol - minCol + 1;
	}
	int area() const {
		return height() * width();
	}

	//! Box after adding the given position.
	BoundingBox extended(Position p) const;
};

//! Bounding box of a non-empty list of positions.
BoundingBox boundingBoxOf(const std::vector<Position>& positions);

//! Format "(row,col)" for log and error messages.
std::string toString(Position p);

} // namespace royal

namespace std {

template <>
struct hash<royal::Position> {
	std::size_t operator()(const royal::Position& p) const noexcept {
		const auto seed = std::hash<int>{}(p.row);
		return seed ^ (std::hash<int>{}(p.col) + 0x9e3779b9u + (seed << 6u) + (seed >> 2u));
	}
};

} // namespace std
