#pragma once

#include "core/IGameStateListener.hpp"

#include <mutex>
#include <vector>

namespace connex {

//! Allows external components to be updated on match progress.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
public:
	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signalDelta(const GameDelta& delta);     //!< Signal an applied move.
	void signalForfeit(const BotForfeit& forfeit); //!< Signal a bot turn lost to a timeout or illegal move.

private:
	std::mutex m_listenerMutex;
	std::vector<IGameStateListener*> m_listeners;
};

} // namespace connex
