#pragma once

#include "model/coordinate.hpp"
#include "model/player.hpp"

#include <variant>

namespace connex {

//! Player claims one empty cell.
struct Placement {
	PlayerId player;
	Coord coord;

	bool operator==(const Placement&) const = default;
};

enum class ActionKind {
	Swap,   //!< Take over the opponent's first stone.
	Resign, //!< Give up the match.
	Pass    //!< Skip the turn. Recorded for forfeited bot turns.
};

//! Player acts without placing a stone.
struct Action {
	PlayerId player;
	ActionKind kind;

	bool operator==(const Action&) const = default;
};

using Move = std::variant<Placement, Action>;

//! Returns the player who made the move.
PlayerId moveOwner(const Move& move);

bool isPass(const Move& move);

} // namespace connex
