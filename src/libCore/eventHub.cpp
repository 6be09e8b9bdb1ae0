#include "core/eventHub.hpp"

#include <algorithm>

namespace c4 {

void EventHub::subscribe(IGameListener* listener, uint64_t signalMask) {
	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameListener* listener) {
	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::signal(GameSignal signal) {
	// Copy: a listener may unsubscribe while being notified.
	const auto listeners = m_listeners;
	for (const auto& [listener, signalMask]: listeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

} // namespace c4
