#include "royal/board.hpp"

#include "Logging.hpp"
#include "royal/errors.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace royal {

void Board::place(const Position pos, const Tile& tile) {
	if (isOccupied(pos)) {
		const auto message = std::format("Field {} is already occupied.", toString(pos));
		Logger().Log(Logging::LogLevel::Warning, std::format("[Board] Rejected placement: {}", message));
		throw RuleError(ErrorType::PositionOccupied, message);
	}

	m_index.emplace(pos, m_tiles.size());
	m_positions.push_back(pos);
	m_tiles.push_back(tile);
}

void Board::flip(const Position pos) {
	const auto it = m_index.find(pos);
	if (it == m_index.end()) {
		const auto message = std::format("No tile at {}.", toString(pos));
		Logger().Log(Logging::LogLevel::Warning, std::format("[Board] Rejected flip: {}", message));
		throw RuleError(ErrorType::PositionEmpty, message);
	}

	m_tiles[it->second].flip();
}

const Tile* Board::tileAt(const Position pos) const {
	const auto it = m_index.find(pos);
	return it == m_index.end() ? nullptr : &m_tiles[it->second];
}

bool Board::isOccupied(const Position pos) const {
	return m_index.contains(pos);
}

bool Board::isEmpty(const Position pos) const {
	return !isOccupied(pos);
}

std::size_t Board::tileCount() const {
	return m_tiles.size();
}

std::size_t Board::countFlipped() const {
	return static_cast<std::size_t>(std::count_if(m_tiles.begin(), m_tiles.end(), [](const Tile& t) { return t.isFlipped(); }));
}

const std::vector<Position>& Board::positions() const {
	return m_positions;
}

std::vector<Position> Board::computeValidPositions() const {
	std::vector<Position> result;

	const auto box = boundingBox();
	if (!box)
		return result;

	std::unordered_set<Position> seen;
	for (const auto occupied: m_positions) {
		for (const auto offset: ORTHOGONAL) {
			const auto candidate = occupied + offset;
			if (isOccupied(candidate) || seen.contains(candidate))
				continue;
			seen.insert(candidate);

			const auto grown = box->extended(candidate);
			if (grown.height() <= BOARD_EXTENT && grown.width() <= BOARD_EXTENT) {
				result.push_back(candidate);
			}
		}
	}

	return result;
}

std::optional<BoundingBox> Board::boundingBox() const {
	if (m_positions.empty())
		return std::nullopt;
	return boundingBoxOf(m_positions);
}

std::optional<Position> Board::snapshotOrigin() const {
	const auto box = boundingBox();
	if (!box)
		return std::nullopt;
	return Position{box->minRow, box->minCol};
}

Snapshot Board::snapshot() const {
	Snapshot result{};

	const auto origin = snapshotOrigin();
	if (!origin)
		return result;

	for (std::size_t i = 0; i != m_positions.size(); ++i) {
		const int r = m_positions[i].row - origin->row;
		const int c = m_positions[i].col - origin->col;
		if (r >= 0 && r < BOARD_EXTENT && c >= 0 && c < BOARD_EXTENT) {
			result[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)] = m_tiles[i];
		}
	}
	return result;
}

bool Board::operator==(const Board& other) const {
	if (tileCount() != other.tileCount())
		return false;

	for (std::size_t i = 0; i != m_positions.size(); ++i) {
		const auto* tile = other.tileAt(m_positions[i]);
		if (!tile || !(*tile == m_tiles[i]))
			return false;
	}
	return true;
}

} // namespace royal
