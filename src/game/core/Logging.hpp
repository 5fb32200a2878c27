#pragma once

#include "Logger/Logger.hpp"

namespace connex {

//! Returns the logger instance of the engine library.
Logging::Logger Logger();

} // namespace connex
