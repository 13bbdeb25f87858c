#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "turbo/request-context.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

struct RateLimitConfig {
  static constexpr uint32_t kDefaultRequestsPerMinute = 1000000;

  bool enabled{false};
  uint32_t requestsPerMinute{kDefaultRequestsPerMinute};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;
};

// Per client fixed window request counter, shared by all the reactors of a server.
class RateLimiter {
 public:
  static constexpr std::chrono::seconds kWindow{60};
  // Expired windows are pruned once the table holds more clients than this.
  static constexpr std::size_t kPruneThreshold = 10000;

  explicit RateLimiter(RateLimitConfig config = {}) : _config(config) {}

  [[nodiscard]] bool enabled() const noexcept { return _config.enabled; }

  [[nodiscard]] const RateLimitConfig& config() const noexcept { return _config; }

  // Counts a request of 'clientKey' and returns true if it is within the limit of the current window.
  // Always true when disabled. Thread safe.
  bool allow(std::string_view clientKey, SteadyTimePoint now = std::chrono::steady_clock::now());

  [[nodiscard]] std::size_t nbClients() const;

  // Identifies the client of a request: first X-Forwarded-For entry, then X-Real-IP, then the peer address.
  [[nodiscard]] static std::string_view ClientKey(const RequestContext& ctx);

 private:
  struct Window {
    SteadyTimePoint start;
    uint32_t count{};
  };

  void pruneExpired(SteadyTimePoint now);

  RateLimitConfig _config;
  mutable std::mutex _mutex;
  std::unordered_map<std::string, Window> _windows;
};

}  // namespace turbo
