#pragma once

#include "Logger/Logger.hpp"

namespace connex::api {

//! Returns the logger instance of the api library.
Logging::Logger Logger();

} // namespace connex::api
