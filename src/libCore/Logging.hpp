#pragma once

#include "Logger/Logger.hpp"

namespace c4 {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace c4
