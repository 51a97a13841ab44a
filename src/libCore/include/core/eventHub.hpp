#pragma once

#include "core/IGameStateListener.hpp"

#include <vector>

namespace ttt {

//! Allows external components to be updated on game state changes.
//! \note Signals are synchronous and run on the caller thread. Not thread safe.
//! Listeners may unsubscribe from within a callback.
class EventHub {
public:
	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	void signalDelta(const GameDelta& delta); //!< Signal a game state delta.

private:
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace ttt
