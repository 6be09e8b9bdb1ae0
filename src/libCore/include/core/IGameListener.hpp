#pragma once

#include "core/types.hpp"

namespace c4 {

class IGameListener {
public:
	virtual ~IGameListener()                    = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

} // namespace c4
