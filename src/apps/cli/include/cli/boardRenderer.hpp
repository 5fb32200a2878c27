#pragma once

#include "core/boardState.hpp"

#include <string>

namespace connex::cli {

//! Draw the board as text with row and column labels.
//! Hex boards are sheared so every row starts one step further right.
std::string renderBoard(const BoardState& state);

} // namespace connex::cli
