#include "turbo/log.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace turbo {

namespace {

constexpr std::string_view kLevelEnvVar = "TURBO_LOG_LEVEL";

bool TryParseLevel(std::string_view levelName, log::level::level_enum& level) {
  // spdlog::level::from_str falls back to 'off' for unknown names, so check explicitly.
  for (int lvl = log::level::trace; lvl < log::level::n_levels; ++lvl) {
    const auto candidate = static_cast<log::level::level_enum>(lvl);
    const auto name = log::level::to_string_view(candidate);
    if (std::string_view(name.data(), name.size()) == levelName) {
      level = candidate;
      return true;
    }
  }
  // Short spellings matching the enumerator names.
  if (levelName == "warn") {
    level = log::level::warn;
    return true;
  }
  if (levelName == "err") {
    level = log::level::err;
    return true;
  }
  return false;
}

}  // namespace

void SetLogLevel(std::string_view levelName) {
  log::level::level_enum level;
  if (!TryParseLevel(levelName, level)) {
    throw std::invalid_argument("Unknown log level '" + std::string(levelName) + "'");
  }
  log::set_level(level);
}

bool SetLogLevelFromEnv() {
  const char* value = std::getenv(kLevelEnvVar.data());
  if (value == nullptr) {
    return false;
  }
  log::level::level_enum level;
  if (!TryParseLevel(value, level)) {
    log::warn("Ignoring invalid {} value '{}'", kLevelEnvVar, value);
    return false;
  }
  log::set_level(level);
  return true;
}

}  // namespace turbo
