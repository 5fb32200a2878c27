#include "cli/boardRenderer.hpp"

#include <format>

namespace connex::cli {

std::string renderBoard(const BoardState& state) {
	const auto size    = state.size();
	const bool sheared = state.config().variant == Variant::Standard;

	std::string out = "    ";
	for (Id col = 0; col < size; ++col) {
		out += std::format("{:<2}", col);
	}
	out += '\n';

	for (Id row = 0; row < size; ++row) {
		out += std::format("{:>3} ", row);
		if (sheared) {
			out.append(row, ' ');
		}

		for (Id col = 0; col < size; ++col) {
			const auto owner = state.ownerAt({row, col});
			out += owner ? static_cast<char>('0' + *owner) : '.';
			out += ' ';
		}
		out += '\n';
	}

	out += std::format("Move {}, player {} to move, {}\n", state.moveCount(), state.currentPlayer(), toString(state.status()));
	return out;
}

} // namespace connex::cli
