#pragma once

#include "royal/board.hpp"
#include "royal/combination.hpp"
#include "royal/position.hpp"
#include "royal/tile.hpp"

#include <cstddef>
#include <vector>

namespace royal {

//! Positions of a cluster, sorted by (row, col).
using Cluster = std::vector<Position>;

//! Every geometrically valid cluster of 3 to 5 unflipped tiles sharing the given attribute.
//! Large groups yield all their valid connected sub-clusters. The result holds no duplicates.
std::vector<Cluster> findClusters(const Board& board, Attribute attribute);

//! Scorable combinations of tiles with the same color.
std::vector<Combination> findByColor(const Board& board);

//! Scorable combinations of tiles with the same symbol.
std::vector<Combination> findBySymbol(const Board& board);

//! Color combinations followed by symbol combinations.
std::vector<Combination> findAll(const Board& board);

//! Positions of a cluster that may be flipped when it is scored.
//! Empty for clusters of size 2 or less. Ties are broken by (row, col) order.
std::vector<Position> flippables(const Cluster& cluster);

//! True if the positions form a connected cluster of size 3 to 5 that passes the shape rules.
bool isValidCluster(const Cluster& cluster);

std::size_t countOrthogonalNeighbors(Position pos, const Cluster& cluster); //!< Neighbours up, down, left, right within cluster.
std::size_t countDiagonalNeighbors(Position pos, const Cluster& cluster);   //!< Corner neighbours within cluster.

} // namespace royal
