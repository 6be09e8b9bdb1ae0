#pragma once

#include "Logger/Logger.hpp"

namespace c4::gui {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace c4::gui
