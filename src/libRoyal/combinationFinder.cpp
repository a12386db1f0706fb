#include "royal/combinationFinder.hpp"

#include "Logging.hpp"
#include "royal/constants.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <limits>
#include <set>
#include <unordered_set>
#include <utility>

namespace royal {

static bool contains(const Cluster& cluster, const Position pos) {
	return std::find(cluster.begin(), cluster.end(), pos) != cluster.end();
}

template <std::size_t N>
static std::size_t countNeighbors(const Position pos, const Cluster& cluster, const std::array<Offset, N>& directions) {
	std::size_t count = 0;
	for (const auto offset: directions) {
		if (contains(cluster, pos + offset))
			++count;
	}
	return count;
}

std::size_t countOrthogonalNeighbors(const Position pos, const Cluster& cluster) {
	return countNeighbors(pos, cluster, ORTHOGONAL);
}

std::size_t countDiagonalNeighbors(const Position pos, const Cluster& cluster) {
	return countNeighbors(pos, cluster, DIAGONAL);
}

//! No member touches another member orthogonally.
static bool isPureDiagonal(const Cluster& cluster) {
	return std::none_of(cluster.begin(), cluster.end(), [&](Position p) { return countOrthogonalNeighbors(p, cluster) > 0; });
}

//! 8-connectivity restricted to the cluster members.
static bool isConnected(const Cluster& cluster) {
	if (cluster.size() < 2)
		return true;

	std::vector<Position> visited{cluster.front()};
	std::vector<Position> stack{cluster.front()};
	while (!stack.empty()) {
		const auto current = stack.back();
		stack.pop_back();

		for (const auto offset: ALL_DIRECTIONS) {
			const auto neighbor = current + offset;
			if (contains(cluster, neighbor) && !contains(visited, neighbor)) {
				visited.push_back(neighbor);
				stack.push_back(neighbor);
			}
		}
	}
	return visited.size() == cluster.size();
}

//! Every step between consecutive members (sorted by row, then column) is the same unit diagonal.
static bool isStraightDiagonal(Cluster cluster) {
	if (cluster.size() < 2)
		return true;

	std::sort(cluster.begin(), cluster.end());
	const int dr = cluster[1].row - cluster[0].row;
	const int dc = cluster[1].col - cluster[0].col;
	if ((dr != 1 && dr != -1) || (dc != 1 && dc != -1))
		return false;

	for (std::size_t i = 1; i + 1 < cluster.size(); ++i) {
		if (cluster[i + 1].row - cluster[i].row != dr || cluster[i + 1].col - cluster[i].col != dc)
			return false;
	}
	return true;
}

static double compactness(const Cluster& cluster) {
	return static_cast<double>(cluster.size()) / boundingBoxOf(cluster).area();
}

//! Repeatedly remove members that hang on a single diagonal neighbour only.
static Cluster stripWeaklyConnected(Cluster cluster) {
	bool changed = true;
	while (changed) {
		Cluster weak;
		for (const auto p: cluster) {
			if (countOrthogonalNeighbors(p, cluster) == 0 && countDiagonalNeighbors(p, cluster) == 1)
				weak.push_back(p);
		}

		changed = !weak.empty();
		std::erase_if(cluster, [&](Position p) { return contains(weak, p); });
	}
	return cluster;
}

//! Three tiles around a single corner tile, not in one line.
static bool isLShape(const Cluster& cluster) {
	if (cluster.size() != 3)
		return false;

	const auto corners = std::count_if(cluster.begin(), cluster.end(), [&](Position p) { return countOrthogonalNeighbors(p, cluster) == 2; });
	if (corners != 1)
		return false;

	const auto box = boundingBoxOf(cluster);
	return box.height() > 1 && box.width() > 1;
}

//! Shape rules for a connected cluster.
static bool hasValidShape(const Cluster& cluster) {
	const auto size = cluster.size();
	if (size < MIN_COMBINATION_SIZE || size > MAX_COMBINATION_SIZE)
		return false;

	if (isPureDiagonal(cluster))
		return isStraightDiagonal(cluster);

	// Mixed shapes: a member touching the rest only at a corner breaks the shape.
	for (const auto p: cluster) {
		if (countOrthogonalNeighbors(p, cluster) == 0)
			return false;
	}

	const auto box    = boundingBoxOf(cluster);
	const auto height = box.height();
	const auto width  = box.width();

	if (size == 4 && std::max(height, width) < 3) {
		return false;
	}
	if (size == 5) {
		const bool straightLine = (height == 1 && width == 5) || (height == 5 && width == 1);
		if (!straightLine) {
			if ((height == 4 && width == 3) || (height == 3 && width == 4))
				return false;
			if (height > 4 || width > 4)
				return false;
		}
	}

	const auto density = compactness(cluster);
	if (density < MIN_COMPACTNESS)
		return false;

	if (stripWeaklyConnected(cluster).size() != size)
		return false;

	return size != 3 || density >= 1.0 || isLShape(cluster);
}

bool isValidCluster(const Cluster& cluster) {
	return cluster.size() >= MIN_COMBINATION_SIZE && cluster.size() <= MAX_COMBINATION_SIZE && isConnected(cluster) && hasValidShape(cluster);
}

//! Unflipped tiles reachable from start over 8 directions that share the attribute with the start tile.
static Cluster findGroup(const Board& board, const Position start, const Attribute attribute) {
	Cluster group;

	const auto* reference = board.tileAt(start);
	if (!reference || reference->isFlipped())
		return group;

	std::unordered_set<Position> visited{start};
	std::vector<Position> stack{start};
	while (!stack.empty()) {
		const auto current = stack.back();
		stack.pop_back();
		group.push_back(current);

		for (const auto offset: ALL_DIRECTIONS) {
			const auto neighbor = current + offset;
			if (visited.contains(neighbor))
				continue;

			const auto* tile = board.tileAt(neighbor);
			if (tile && !tile->isFlipped() && tile->shares(*reference, attribute)) {
				visited.insert(neighbor);
				stack.push_back(neighbor);
			}
		}
	}

	std::sort(group.begin(), group.end());
	return group;
}

//! Append all valid connected subsets of size 3 to 5 of the group that were not seen yet.
static void collectSubClusters(const Cluster& group, std::set<Cluster>& seen, std::vector<Cluster>& out) {
	const auto n = group.size();
	for (std::size_t k = MIN_COMBINATION_SIZE; k <= std::min(n, MAX_COMBINATION_SIZE); ++k) {
		std::vector<std::size_t> idx(k);
		for (std::size_t i = 0; i != k; ++i) {
			idx[i] = i;
		}

		while (true) {
			Cluster subset;
			subset.reserve(k);
			for (const auto i: idx) {
				subset.push_back(group[i]);
			}

			if (isConnected(subset) && hasValidShape(subset) && seen.insert(subset).second) {
				out.push_back(std::move(subset));
			}

			// Advance to the next k-combination of indices in lexicographic order.
			std::size_t i = k;
			while (i > 0 && idx[i - 1] == n - k + i - 1) {
				--i;
			}
			if (i == 0)
				break;

			++idx[i - 1];
			for (std::size_t j = i; j != k; ++j) {
				idx[j] = idx[j - 1] + 1;
			}
		}
	}
}

std::vector<Cluster> findClusters(const Board& board, const Attribute attribute) {
	std::vector<Cluster> result;
	std::set<Cluster> seen;

	auto starts = board.positions();
	std::sort(starts.begin(), starts.end());

	std::unordered_set<Position> visited;
	std::size_t groups = 0;
	for (const auto start: starts) {
		const auto* tile = board.tileAt(start);
		if (visited.contains(start) || tile->isFlipped())
			continue;

		const auto group = findGroup(board, start, attribute);
		visited.insert(group.begin(), group.end());
		if (group.size() < MIN_COMBINATION_SIZE)
			continue;

		++groups;
		collectSubClusters(group, seen, result);
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[CombinationFinder] {} pass: {} group(s) of 3+, {} valid cluster(s).",
	                                                   attribute == Attribute::Color ? "Color" : "Symbol", groups, result.size()));
	return result;
}

//! Exactly two members with one neighbour in the given directions, all others with two.
template <std::size_t N>
static bool isLinearChain(const Cluster& cluster, const std::array<Offset, N>& directions) {
	std::size_t endpoints = 0;
	for (const auto p: cluster) {
		const auto neighbors = countNeighbors(p, cluster, directions);
		if (neighbors == 1)
			++endpoints;
		else if (neighbors != 2)
			return false;
	}
	return endpoints == 2;
}

//! Member with the smallest sum of Manhattan distances to all other members.
static Position geometricCenter(const Cluster& cluster) {
	Position center{cluster.front()};
	int minDistance = std::numeric_limits<int>::max();
	for (const auto candidate: cluster) {
		int distance = 0;
		for (const auto other: cluster) {
			distance += manhattanDistance(candidate, other);
		}
		if (distance < minDistance) {
			minDistance = distance;
			center      = candidate;
		}
	}
	return center;
}

//! The count members with the most neighbours in the given directions. Earlier members win ties.
template <std::size_t N>
static std::vector<Position> mostConnected(const Cluster& cluster, const std::array<Offset, N>& directions, const std::size_t count) {
	std::vector<Position> ranked = cluster;
	std::stable_sort(ranked.begin(), ranked.end(), [&](Position a, Position b) {
		return countNeighbors(a, cluster, directions) > countNeighbors(b, cluster, directions);
	});
	ranked.resize(std::min(count, ranked.size()));
	return ranked;
}

std::vector<Position> flippables(const Cluster& cluster) {
	if (cluster.size() <= 2)
		return {};

	Cluster sorted = cluster;
	std::sort(sorted.begin(), sorted.end());

	const bool diagonal = isPureDiagonal(sorted);
	const bool oddSize  = sorted.size() % 2 == 1;

	if (sorted.size() == MAX_COMBINATION_SIZE) {
		if (diagonal ? isLinearChain(sorted, DIAGONAL) : isLinearChain(sorted, ORTHOGONAL))
			return {geometricCenter(sorted)};
	}

	if (diagonal) {
		return mostConnected(sorted, DIAGONAL, oddSize ? 1u : 2u);
	}
	if (oddSize) {
		return mostConnected(sorted, ORTHOGONAL, 1u);
	}

	std::vector<Position> result;
	std::copy_if(sorted.begin(), sorted.end(), std::back_inserter(result), [&](Position p) { return countOrthogonalNeighbors(p, sorted) >= 2; });
	return result;
}

static std::vector<Combination> toCombinations(const std::vector<Cluster>& clusters) {
	std::vector<Combination> result;
	for (const auto& cluster: clusters) {
		auto flippable = flippables(cluster);
		if (!flippable.empty()) {
			result.emplace_back(cluster, std::move(flippable));
		}
	}
	return result;
}

std::vector<Combination> findByColor(const Board& board) {
	return toCombinations(findClusters(board, Attribute::Color));
}

std::vector<Combination> findBySymbol(const Board& board) {
	return toCombinations(findClusters(board, Attribute::Symbol));
}

std::vector<Combination> findAll(const Board& board) {
	auto result       = findByColor(board);
	const auto symbol = findBySymbol(board);
	result.insert(result.end(), symbol.begin(), symbol.end());
	return result;
}

} // namespace royal
