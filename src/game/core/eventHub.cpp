#include "core/eventHub.hpp"

#include <algorithm>

namespace connex {

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
		m_listeners.push_back(listener);
	}
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
}

void EventHub::signalDelta(const GameDelta& delta) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (auto* listener: m_listeners) {
		listener->onGameDelta(delta);
	}
}

void EventHub::signalForfeit(const BotForfeit& forfeit) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (auto* listener: m_listeners) {
		listener->onBotForfeit(forfeit);
	}
}

} // namespace connex
