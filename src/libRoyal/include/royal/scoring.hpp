#pragma once

#include "royal/board.hpp"
#include "royal/combination.hpp"
#include "royal/player.hpp"
#include "royal/position.hpp"

#include <vector>

namespace royal {

//! Points of a combination: 3 tiles -> 2, 4 -> 4, 5 -> 7, plus 1 if any of its tiles on the board has a crown.
//! Throws RuleError(InvalidCombinationSize) for any other size.
unsigned scoreCombination(const Combination& combo, const Board& board);

//! Award the combination to the player and flip the selected tiles on the player's board.
//! \param flipSelections 1 or 2 distinct positions out of the flippable positions of the combination.
//! \returns Points added to the player.
//! \note Throws RuleError(InvalidFlipSelection) for an invalid selection. Nothing is changed if an error is thrown.
unsigned settleCombination(Player& player, const Combination& combo, const std::vector<Position>& flipSelections);

//! Players with the highest score. Ties are won by the player with fewer flipped tiles.
std::vector<const Player*> determineWinners(const std::vector<Player>& players);

} // namespace royal
