#pragma once

#include "core/boardState.hpp"
#include "core/parseError.hpp"
#include "model/move.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace connex {

//! Match setup and every applied move in order.
struct Transcript {
	Config config{};
	std::vector<Move> moves{};

	bool operator==(const Transcript&) const = default;
};

//! Encode one move as a transcript line without newline: "P0 3,4", "P1 swap", "P1 resign" or "P0 pass".
std::string encodeMove(const Move& move);

//! Encode the config line, the moves header and one line per move.
std::string encodeTranscript(const Transcript& transcript);

//! Play the moves from an empty board.
//! A rejected move yields DuplicateCell for occupied cells and IllegalMove otherwise, with the violation attached.
//! \param [out] out Terminal state, written only on success.
std::optional<ParseError> replayTranscript(const Transcript& transcript, BoardState& out);

//! Decode and replay a transcript. Nothing is written unless every line parses and every move is legal.
std::optional<ParseError> decodeTranscript(std::string_view text, Transcript& outTranscript, BoardState& outState);

} // namespace connex
