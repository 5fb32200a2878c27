#include "model/move.hpp"

namespace connex {

PlayerId moveOwner(const Move& move) {
	return std::visit([](const auto& m) { return m.player; }, move);
}

bool isPass(const Move& move) {
	const auto* action = std::get_if<Action>(&move);
	return action && action->kind == ActionKind::Pass;
}

} // namespace connex
