#pragma once

#include "core/boardState.hpp"
#include "model/move.hpp"

#include <stop_token>

namespace connex {

//! Move choosing capability of a bot player.
//! Implementations must be safe to call from several matches at once.
class IBot {
public:
	virtual ~IBot() = default;

	//! Pick a move for the player on turn.
	//! \param stop Requested when the time budget ran out. The result is discarded afterwards.
	virtual Move chooseMove(const BoardState& state, std::stop_token stop) = 0;
};

} // namespace connex
