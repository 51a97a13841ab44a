#pragma once

#include "Logger/Logger.hpp"

namespace ttt::cli {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace ttt::cli
