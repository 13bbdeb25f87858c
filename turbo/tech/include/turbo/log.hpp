#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <string_view>

namespace turbo {

namespace log = spdlog;

// Sets the global log level from its name (trace, debug, info, warn, error, critical, off).
// Throws std::invalid_argument for an unknown level name.
void SetLogLevel(std::string_view levelName);

// Applies the level named by the TURBO_LOG_LEVEL environment variable, if set.
// Returns true if the variable was present and valid.
bool SetLogLevelFromEnv();

}  // namespace turbo
