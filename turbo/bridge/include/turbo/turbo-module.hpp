#pragma once

#include <cstdint>
#include <string>

#include "turbo/handler-registry.hpp"

namespace turbo {

// Application level settings set from Python with turbo.configure_rate_limiting().
struct AppSettings {
  static constexpr uint32_t kDefaultRequestsPerMinute = 1000000;

  bool rateLimitConfigured{false};
  bool rateLimitEnabled{false};
  uint32_t requestsPerMinute{kDefaultRequestsPerMinute};
};

// Registers the builtin 'turbo' module. Must be called before the interpreter is initialized.
void RegisterTurboModule();

// Registry filled by the @turbo.route decorators of the application.
HandlerRegistry& DefaultRegistry();

// Settings filled by the application. Read and written with the execution lock held.
AppSettings& DefaultAppSettings();

// Records where the server listens, reported by turbo.info(). Thread safe.
void SetServerDescription(std::string address, uint32_t nbThreads);

// Description returned by turbo.info(). Requires the execution lock.
std::string ServerDescription();

}  // namespace turbo
