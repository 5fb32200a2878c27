#include "core/ruleEngine.hpp"

#include <cassert>
#include <utility>

namespace connex {

static std::optional<RuleViolation> checkSpecific(const BoardState& state, const Placement& placement) {
	if (!state.inBounds(placement.coord)) {
		return RuleViolation::OutOfBounds;
	}
	if (!state.isEmpty(placement.coord)) {
		return RuleViolation::CellOccupied;
	}
	return {};
}

static std::optional<RuleViolation> checkSpecific(const BoardState& state, const Action& action) {
	switch (action.kind) {
	case ActionKind::Swap:
		if (!isSwapAvailable(state)) {
			return RuleViolation::SwapNotAvailable;
		}
		return {};
	case ActionKind::Resign:
	case ActionKind::Pass:
		return {};
	}
	return {};
}

static void applyChecked(BoardState& state, const Placement& placement) {
	if (state.place(placement.coord, placement.player)) {
		state.setStatus(GameStatus::won(placement.player));
	}
	state.setCurrentPlayer(nextPlayer(placement.player, state.config().numPlayers));
}

static void applyChecked(BoardState& state, const Action& action) {
	switch (action.kind) {
	case ActionKind::Swap: {
		assert(state.stones().size() == 1u);
		const auto stone = state.stones().begin()->first;
		state.reassign(stone, action.player);
		// Continue as if the swapping player had placed the stone.
		state.setCurrentPlayer(nextPlayer(action.player, state.config().numPlayers));
		break;
	}
	case ActionKind::Resign:
		state.setStatus(GameStatus::resigned(action.player));
		break;
	case ActionKind::Pass:
		state.setCurrentPlayer(nextPlayer(action.player, state.config().numPlayers));
		break;
	}
}

bool isSwapAvailable(const BoardState& state) {
	return !state.isOver() && state.moveCount() == 1u && state.stones().size() == 1u;
}

std::optional<RuleViolation> checkMove(const BoardState& state, const Move& move) {
	if (state.isOver()) {
		return RuleViolation::GameAlreadyOver;
	}
	if (moveOwner(move) != state.currentPlayer()) {
		return RuleViolation::OutOfTurn;
	}
	return std::visit([&](const auto& m) { return checkSpecific(state, m); }, move);
}

std::optional<RuleViolation> applyMove(const BoardState& current, const Move& move, BoardState& out) {
	if (const auto violation = checkMove(current, move)) {
		return violation;
	}

	BoardState next = current;
	std::visit([&](const auto& m) { applyChecked(next, m); }, move);
	next.setMoveCount(current.moveCount() + 1u);

	out = std::move(next);
	return {};
}

std::optional<RuleViolation> applyMoveInPlace(BoardState& state, const Move& move) {
	if (const auto violation = checkMove(state, move)) {
		return violation;
	}

	std::visit([&](const auto& m) { applyChecked(state, m); }, move);
	state.setMoveCount(state.moveCount() + 1u);
	return {};
}

} // namespace connex
