#pragma once

#include "model/player.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace connex {

//! Outcome of a match so far.
struct GameStatus {
	enum class Kind {
		InProgress, //!< Moves are still accepted.
		Won,        //!< Player connected both of its edges.
		Resigned    //!< Player gave up.
	};

	Kind kind{Kind::InProgress};
	PlayerId player{0u}; //!< Winner or resigning player. Zero while in progress.

	static constexpr GameStatus inProgress() {
		return {};
	}
	static constexpr GameStatus won(PlayerId player) {
		return {Kind::Won, player};
	}
	static constexpr GameStatus resigned(PlayerId player) {
		return {Kind::Resigned, player};
	}

	bool operator==(const GameStatus&) const = default;
};

//! Text form used by the notations and messages: InProgress, Won:<p> or Resigned:<p>.
std::string toString(const GameStatus& status);

//! Parse the text form. Returns empty on malformed input.
std::optional<GameStatus> statusFromString(std::string_view text);

} // namespace connex
