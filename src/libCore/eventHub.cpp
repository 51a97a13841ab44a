#include "core/eventHub.hpp"

#include <algorithm>

namespace ttt {

void EventHub::subscribe(IGameStateListener* listener) {
	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	m_stateListeners.erase(std::remove(m_stateListeners.begin(), m_stateListeners.end(), listener), m_stateListeners.end());
}

void EventHub::signalDelta(const GameDelta& delta) {
	// Iterate a snapshot. Callbacks may change the subscriptions.
	const auto listeners = m_stateListeners;
	for (auto* listener: listeners) {
		if (std::find(m_stateListeners.begin(), m_stateListeners.end(), listener) != m_stateListeners.end()) {
			listener->onGameDelta(delta);
		}
	}
}

} // namespace ttt
