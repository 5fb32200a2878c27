#pragma once

#include <compare>

namespace connex {

using Id = unsigned; //!< Row or column index on the board.

//! Coordinate pair for the board.
//! \note Origin is the top left corner. Ordering is row-major.
struct Coord {
	Id row, col;

	auto operator<=>(const Coord&) const = default;
};

} // namespace connex
