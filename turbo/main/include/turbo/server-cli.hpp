#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "turbo/http-server-config.hpp"

namespace turbo {

inline constexpr std::string_view kServerUsage =
    "Usage: turbo-server <app.py> [--host H] [--port P] [--threads N] [--timeout-ms T] [--log-level L] "
    "[--rate-limit RPM]\n"
    "  --host H          IPv4 address to bind (default 0.0.0.0)\n"
    "  --port P          TCP port (default 8000, 0 for an ephemeral one)\n"
    "  --threads N       number of reactor threads (default clamp(3 x cores, 8, 24))\n"
    "  --timeout-ms T    deadline of async handlers in milliseconds (default 30000, 0 disables it)\n"
    "  --log-level L     trace, debug, info, warn, error, critical or off (default info, or TURBO_LOG_LEVEL)\n"
    "  --rate-limit RPM  enable per client rate limiting at RPM requests per minute\n";

struct ServerOptions {
  static constexpr uint16_t kDefaultPort = 8000;

  std::string appPath;
  std::optional<std::string> logLevel;
  HttpServerConfig config{HttpServerConfig{}.withPort(kDefaultPort)};
  bool help{false};
};

// Parses the command line arguments (program name excluded).
// Throws std::invalid_argument with a descriptive message on unknown options or invalid values.
ServerOptions ParseServerArgs(std::span<const char* const> args);

// Loads the application and serves it until SIGINT or SIGTERM. Returns the process exit code.
int RunServer(const ServerOptions& options);

}  // namespace turbo
