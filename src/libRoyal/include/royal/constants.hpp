#pragma once

#include <array>
#include <cstddef>

namespace royal {

static constexpr int BOARD_EXTENT    = 5;   //!< Maximum rows and columns covered by the tiles of one board.
static constexpr int EMPTY_CELL_CODE = 990; //!< Cell code of an empty field in the save format.

static constexpr std::size_t MIN_COMBINATION_SIZE = 3;
static constexpr std::size_t MAX_COMBINATION_SIZE = 5;
static constexpr std::size_t MAX_FLIP_SELECTION   = 2; //!< Tiles that may be flipped when settling one combination.

static constexpr double MIN_COMPACTNESS = 0.5; //!< Minimum ratio of cluster size to bounding box area.

static constexpr unsigned CROWN_BONUS = 1; //!< Extra point if any tile of a combination has a crown.

//! Base points of a combination, indexed by its size.
static constexpr std::array<unsigned, MAX_COMBINATION_SIZE + 1> BASE_POINTS{0, 0, 0, 2, 4, 7};

} // namespace royal
