#pragma once

#include "core/boardState.hpp"
#include "core/parseError.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace connex {

//! Match facts the position notation does not carry.
struct PositionContext {
	unsigned numPlayers{2u};
	Variant variant{Variant::Standard};
};

//! Encode a board position.
//! Format, one field per line: size=N, grid= followed by N rows ('.' free, digit owner), turn=P and status=S.
std::string encodePosition(const BoardState& state);

//! Decode a board position and check that the status agrees with the stones.
//! The move count is derived from the stones, the turn and the status.
//! \param [out] out Written only on success.
std::optional<ParseError> decodePosition(std::string_view text, BoardState& out, const PositionContext& context = {});

} // namespace connex
