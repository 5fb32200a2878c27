#pragma once

#include "model/errors.hpp"
#include "model/gameStatus.hpp"
#include "model/move.hpp"

namespace connex {

//! Symbolises the game state change after one move.
struct GameDelta {
	unsigned moveId;     //!< Move number, starting at 1.
	Move move;           //!< Applied move.
	PlayerId nextPlayer; //!< Player to make the next move.
	GameStatus status;   //!< Status after the move.
};

//! A bot seat lost its turn.
struct BotForfeit {
	PlayerId player;
	BotError reason;
	Move recorded; //!< Resign or Pass recorded in its place.
};

} // namespace connex
