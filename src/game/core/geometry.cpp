#include "core/geometry.hpp"

namespace connex {

static constexpr std::array<int, 4> kSquareDr{1, -1, 0, 0};
static constexpr std::array<int, 4> kSquareDc{0, 0, 1, -1};

// Hex cells on a rhombus: the two diagonal neighbours are up-right and down-left.
static constexpr std::array<int, 6> kHexDr{-1, -1, 0, 0, 1, 1};
static constexpr std::array<int, 6> kHexDc{0, 1, -1, 1, -1, 0};

Axis playerAxis(PlayerId player) {
	return player % 2u == 0u ? Axis::TopBottom : Axis::LeftRight;
}

bool touchesFirstEdge(Coord c, std::size_t, Axis axis) {
	return axis == Axis::TopBottom ? c.row == 0u : c.col == 0u;
}

bool touchesSecondEdge(Coord c, std::size_t boardSize, Axis axis) {
	const auto last = boardSize - 1u;
	return axis == Axis::TopBottom ? c.row == last : c.col == last;
}

template <std::size_t N>
static void collect(Coord c, std::size_t boardSize, const std::array<int, N>& dr, const std::array<int, N>& dc, Neighbours& out) {
	for (std::size_t i = 0; i < N; ++i) {
		const long r = static_cast<long>(c.row) + dr[i];
		const long k = static_cast<long>(c.col) + dc[i];
		if (r < 0 || k < 0 || r >= static_cast<long>(boardSize) || k >= static_cast<long>(boardSize))
			continue;

		out.push({static_cast<Id>(r), static_cast<Id>(k)});
	}
}

Neighbours neighbours(Coord c, std::size_t boardSize, Variant variant) {
	Neighbours result;
	switch (variant) {
	case Variant::Standard:
		collect(c, boardSize, kHexDr, kHexDc, result);
		break;
	case Variant::Square:
		collect(c, boardSize, kSquareDr, kSquareDc, result);
		break;
	}
	return result;
}

} // namespace connex
