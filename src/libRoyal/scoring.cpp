#include "royal/scoring.hpp"

#include "Logging.hpp"
#include "royal/constants.hpp"
#include "royal/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <limits>
#include <string>

namespace royal {

unsigned scoreCombination(const Combination& combo, const Board& board) {
	const auto size = combo.size();
	if (size < MIN_COMBINATION_SIZE || size > MAX_COMBINATION_SIZE) {
		const auto message = std::format("Combination of {} tiles cannot be scored.", size);
		Logger().Log(Logging::LogLevel::Warning, std::format("[Scoring] {}", message));
		throw RuleError(ErrorType::InvalidCombinationSize, message);
	}

	const bool hasCrown = std::any_of(combo.positions().begin(), combo.positions().end(), [&](Position p) {
		const auto* tile = board.tileAt(p);
		return tile && tile->hasCrown();
	});

	return BASE_POINTS[size] + (hasCrown ? CROWN_BONUS : 0u);
}

[[noreturn]] static void rejectSelection(const std::string& message) {
	Logger().Log(Logging::LogLevel::Warning, std::format("[Scoring] Rejected flip selection: {}", message));
	throw RuleError(ErrorType::InvalidFlipSelection, message);
}

unsigned settleCombination(Player& player, const Combination& combo, const std::vector<Position>& flipSelections) {
	if (flipSelections.empty() || flipSelections.size() > MAX_FLIP_SELECTION) {
		rejectSelection(std::format("{} tiles selected, expected 1 to {}.", flipSelections.size(), MAX_FLIP_SELECTION));
	}
	for (const auto pos: flipSelections) {
		if (!combo.isFlippable(pos)) {
			rejectSelection(std::format("{} is not a flippable tile of the combination.", toString(pos)));
		}
		if (std::count(flipSelections.begin(), flipSelections.end(), pos) > 1) {
			rejectSelection(std::format("{} selected twice.", toString(pos)));
		}
		if (player.board().isEmpty(pos)) {
			const auto message = std::format("No tile at {} on the board of '{}'.", toString(pos), player.name());
			Logger().Log(Logging::LogLevel::Warning, std::format("[Scoring] Rejected flip selection: {}", message));
			throw RuleError(ErrorType::PositionEmpty, message);
		}
	}

	const auto points = scoreCombination(combo, player.board());

	player.addScore(points);
	for (const auto pos: flipSelections) {
		player.board().flip(pos);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Scoring] '{}' scored {} point(s) for {} tiles, flipped {}.", player.name(), points,
	                                                  combo.size(), flipSelections.size()));
	return points;
}

std::vector<const Player*> determineWinners(const std::vector<Player>& players) {
	std::vector<const Player*> winners;
	if (players.empty())
		return winners;

	const auto maxScore =
	        std::max_element(players.begin(), players.end(), [](const Player& a, const Player& b) { return a.score() < b.score(); })->score();

	std::size_t minFlipped = std::numeric_limits<std::size_t>::max();
	for (const auto& player: players) {
		if (player.score() == maxScore)
			minFlipped = std::min(minFlipped, player.board().countFlipped());
	}

	for (const auto& player: players) {
		if (player.score() == maxScore && player.board().countFlipped() == minFlipped)
			winners.push_back(&player);
	}
	return winners;
}

} // namespace royal
