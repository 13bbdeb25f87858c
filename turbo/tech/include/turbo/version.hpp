#pragma once

#include <string_view>

#ifndef TURBO_VERSION_STR
#error "TURBO_VERSION_STR must be defined via build system"
#endif

namespace turbo {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return TURBO_VERSION_STR; }

}  // namespace turbo
