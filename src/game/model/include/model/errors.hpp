#pragma once

#include <string_view>

namespace connex {

//! Reasons the rule engine rejects a move.
enum class RuleViolation {
	OutOfTurn,
	OutOfBounds,
	CellOccupied,
	SwapNotAvailable,
	GameAlreadyOver,
	PassNotAllowed, //!< Passes are recorded for forfeited bot turns only.
};

//! Failures while obtaining a move from a bot.
enum class BotError {
	NotFound,   //!< No bot registered under the requested name.
	Timeout,    //!< Bot did not answer within its time budget.
	IllegalMove //!< Bot answered with a move the rule engine rejects, or failed.
};

std::string_view toString(RuleViolation violation);
std::string_view toString(BotError error);

} // namespace connex
