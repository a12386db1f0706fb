#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace royal {

//! Rule violations reported by the engine.
enum class ErrorType {
	PositionOccupied,       //!< Placement onto a filled cell.
	PositionEmpty,          //!< Flip attempted on an empty cell.
	InvalidTileCode,        //!< Color or symbol code outside 1..6.
	InvalidCombinationSize, //!< Scoring requested for a cluster not of size 3, 4 or 5.
	InvalidFlipSelection    //!< Flip selection empty, too large or not part of the flippable set.
};

//! Stable name of an error type.
std::string_view toString(ErrorType type);

//! Thrown when a request violates the game rules. The state of the target is left unchanged.
class RuleError : public std::runtime_error {
public:
	RuleError(ErrorType type, const std::string& message);

	ErrorType type() const;

private:
	ErrorType m_type;
};

} // namespace royal
