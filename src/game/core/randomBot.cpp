#include "core/randomBot.hpp"

namespace connex {

RandomBot::RandomBot() : m_rng(std::random_device{}()) {
}

RandomBot::RandomBot(std::uint64_t seed) : m_rng(seed) {
}

Move RandomBot::chooseMove(const BoardState& state, std::stop_token) {
	const auto player = state.currentPlayer();
	const auto free   = state.emptyCells();
	if (free.empty()) {
		return Action{player, ActionKind::Resign};
	}

	std::uniform_int_distribution<std::size_t> pick(0u, free.size() - 1u);

	std::lock_guard<std::mutex> lock(m_rngMutex);
	return Placement{player, free[pick(m_rng)]};
}

} // namespace connex
