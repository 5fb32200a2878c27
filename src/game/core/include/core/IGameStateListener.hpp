#pragma once

#include "core/gameEvent.hpp"

namespace connex {

class IGameStateListener {
public:
	virtual ~IGameStateListener()                    = default;
	virtual void onGameDelta(const GameDelta& delta) = 0;
	virtual void onBotForfeit(const BotForfeit&) {
	}
};

} // namespace connex
