#pragma once

#include "Logger/Logger.hpp"

namespace noughts::server {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace noughts::server
