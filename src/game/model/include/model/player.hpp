#pragma once

namespace connex {

using PlayerId = unsigned; //!< Seat index in [0, numPlayers).

//! Returns the player after input player in turn order.
inline constexpr PlayerId nextPlayer(PlayerId player, unsigned numPlayers) {
	return (player + 1u) % numPlayers;
}

} // namespace connex
