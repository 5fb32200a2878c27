#pragma once

#include "Logger/Logger.hpp"

namespace connex::cli {

//! Returns the logger instance of the terminal front end.
Logging::Logger Logger();

} // namespace connex::cli
