#include "royal/errors.hpp"

#include <format>

namespace royal {

std::string_view toString(const ErrorType type) {
	switch (type) {
	case ErrorType::PositionOccupied:
		return "PositionOccupied";
	case ErrorType::PositionEmpty:
		return "PositionEmpty";
	case ErrorType::InvalidTileCode:
		return "InvalidTileCode";
	case ErrorType::InvalidCombinationSize:
		return "InvalidCombinationSize";
	case ErrorType::InvalidFlipSelection:
		return "InvalidFlipSelection";
	}
	return "Unknown";
}

RuleError::RuleError(const ErrorType type, const std::string& message)
    : std::runtime_error(std::format("{}: {}", toString(type), message)), m_type{type} {
}

ErrorType RuleError::type() const {
	return m_type;
}

} // namespace royal
