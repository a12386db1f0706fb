#pragma once

#include "Logger/Logger.hpp"

namespace royal {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace royal
