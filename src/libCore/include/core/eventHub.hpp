#pragma once

#include "core/IGameListener.hpp"
#include "core/types.hpp"

#include <vector>

namespace c4 {

//! Allows external components to be updated on game events.
//! \note Signals are delivered synchronously on the thread calling into the game.
class EventHub {
	struct ListenerEntry {
		IGameListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;     //!< What events the listener cares about.
	};

public:
	void subscribe(IGameListener* listener, uint64_t signalMask);
	void unsubscribe(IGameListener* listener);

	//! Signal a game event.
	void signal(GameSignal signal);

private:
	std::vector<ListenerEntry> m_listeners;
};

} // namespace c4
