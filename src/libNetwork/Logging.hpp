#pragma once

#include "Logger/Logger.hpp"

namespace noughts::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace noughts::network
