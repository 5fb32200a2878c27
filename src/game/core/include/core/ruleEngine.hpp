#pragma once

#include "core/boardState.hpp"
#include "model/errors.hpp"
#include "model/move.hpp"

#include <optional>

namespace connex {

//! Check a move against the rules without applying it.
//! Checks run in order: game over, turn, then the move specific checks (bounds and occupancy, swap availability).
std::optional<RuleViolation> checkMove(const BoardState& state, const Move& move);

//! Compute the state after a move. Returns the violation when the move is illegal.
//! \param [out] out Written only when the move is legal.
//! \note Works on a copy of the state, which costs O(size^2) per call.
std::optional<RuleViolation> applyMove(const BoardState& current, const Move& move, BoardState& out);

//! Check the move and apply it to the state directly. The state is left untouched when the move is illegal.
std::optional<RuleViolation> applyMoveInPlace(BoardState& state, const Move& move);

//! The swap rule applies to the reply to the very first stone only.
bool isSwapAvailable(const BoardState& state);

} // namespace connex
