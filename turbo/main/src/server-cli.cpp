#include "turbo/server-cli.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "turbo/log.hpp"
#include "turbo/multi-http-server.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-runtime.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/turbo-module.hpp"
#include "turbo/version.hpp"

namespace turbo {

namespace {

template <class T>
T ParseNumber(std::string_view option, std::string_view value, T minValue,
              T maxValue = std::numeric_limits<T>::max()) {
  T ret{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ret);
  if (ec != std::errc{} || ptr != value.data() + value.size() || ret < minValue || ret > maxValue) {
    throw std::invalid_argument(fmt::format("Invalid value '{}' for {}", value, option));
  }
  return ret;
}

}  // namespace

ServerOptions ParseServerArgs(std::span<const char* const> args) {
  ServerOptions options;
  for (std::size_t argPos = 0; argPos < args.size(); ++argPos) {
    const std::string_view arg(args[argPos]);
    if (arg == "-h" || arg == "--help") {
      options.help = true;
      continue;
    }
    if (!arg.starts_with("--")) {
      if (!options.appPath.empty()) {
        throw std::invalid_argument(fmt::format("Unexpected argument '{}'", arg));
      }
      options.appPath.assign(arg);
      continue;
    }
    if (argPos + 1 == args.size()) {
      throw std::invalid_argument(fmt::format("Missing value for {}", arg));
    }
    const std::string_view value(args[++argPos]);
    HttpServerConfig& config = options.config;
    if (arg == "--host") {
      config.withBindAddress(std::string(value));
    } else if (arg == "--port") {
      config.withPort(ParseNumber<uint16_t>(arg, value, 0));
    } else if (arg == "--threads") {
      config.withNbThreads(ParseNumber<uint32_t>(arg, value, 1, 1024));
    } else if (arg == "--timeout-ms") {
      config.withHandlerTimeout(std::chrono::milliseconds{ParseNumber<uint32_t>(arg, value, 0)});
    } else if (arg == "--log-level") {
      options.logLevel.emplace(value);
    } else if (arg == "--rate-limit") {
      RateLimitConfig rateLimit;
      rateLimit.enabled = true;
      rateLimit.requestsPerMinute = ParseNumber<uint32_t>(arg, value, 1);
      config.withRateLimit(rateLimit);
    } else {
      throw std::invalid_argument(fmt::format("Unknown option {}", arg));
    }
  }
  if (options.appPath.empty() && !options.help) {
    throw std::invalid_argument("Missing application file");
  }
  options.config.validate();
  return options;
}

int RunServer(const ServerOptions& options) {
  SetLogLevelFromEnv();
  if (options.logLevel) {
    SetLogLevel(*options.logLevel);
  }

  PythonRuntime runtime;
  log::info("turbo {} on Python {}", version(), runtime.version());
  try {
    runtime.runFile(options.appPath);
  } catch (const PythonException& ex) {
    log::critical("Unable to load {}: {}\n{}", options.appPath, ex.what(), ex.error().traceback);
    return EXIT_FAILURE;
  }

  MultiHttpServer server(options.config);
  {
    const std::string routes = DefaultRegistry().describe();
    if (routes.empty()) {
      log::warn("{} registers no route", options.appPath);
    } else {
      log::info("Routes:\n{}", routes);
    }
  }
  server.run();
  return EXIT_SUCCESS;
}

}  // namespace turbo
