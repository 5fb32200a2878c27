#pragma once

#include "model/config.hpp"
#include "model/coordinate.hpp"
#include "model/player.hpp"

#include <array>
#include <cstddef>

namespace connex {

//! The pair of opposite board edges a player has to connect.
enum class Axis {
	TopBottom, //!< Row 0 to row size-1.
	LeftRight  //!< Column 0 to column size-1.
};

//! Players with an even id connect top to bottom, odd ids connect left to right.
//! \note With more than two players several players share an axis.
Axis playerAxis(PlayerId player);

bool touchesFirstEdge(Coord c, std::size_t boardSize, Axis axis);  //!< Top or left edge.
bool touchesSecondEdge(Coord c, std::size_t boardSize, Axis axis); //!< Bottom or right edge.

//! Cells adjacent to a coordinate that lie on the board.
class Neighbours {
public:
	using Storage = std::array<Coord, 6>;

	const Coord* begin() const {
		return m_cells.data();
	}
	const Coord* end() const {
		return m_cells.data() + m_count;
	}
	std::size_t size() const {
		return m_count;
	}

	void push(Coord c) {
		m_cells[m_count++] = c;
	}

private:
	Storage m_cells{};
	std::size_t m_count{0u};
};

//! Returns the on-board neighbours of c for the adjacency rule of the variant.
Neighbours neighbours(Coord c, std::size_t boardSize, Variant variant);

} // namespace connex
