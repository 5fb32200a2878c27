#include "model/errors.hpp"

namespace connex {

std::string_view toString(RuleViolation violation) {
	switch (violation) {
	case RuleViolation::OutOfTurn:
		return "OutOfTurn";
	case RuleViolation::OutOfBounds:
		return "OutOfBounds";
	case RuleViolation::CellOccupied:
		return "CellOccupied";
	case RuleViolation::SwapNotAvailable:
		return "SwapNotAvailable";
	case RuleViolation::GameAlreadyOver:
		return "GameAlreadyOver";
	case RuleViolation::PassNotAllowed:
		return "PassNotAllowed";
	}
	return {};
}

std::string_view toString(BotError error) {
	switch (error) {
	case BotError::NotFound:
		return "NotFound";
	case BotError::Timeout:
		return "Timeout";
	case BotError::IllegalMove:
		return "IllegalMove";
	}
	return {};
}

} // namespace connex
