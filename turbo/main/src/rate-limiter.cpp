#include "turbo/rate-limiter.hpp"

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbo/http-constants.hpp"
#include "turbo/log.hpp"
#include "turbo/request-context.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

namespace {

constexpr std::string_view kWhitespace = " \t";

std::string_view Trim(std::string_view value) {
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

}  // namespace

void RateLimitConfig::validate() const {
  if (enabled && requestsPerMinute == 0) {
    throw std::invalid_argument("rate limit requestsPerMinute must be > 0");
  }
}

bool RateLimiter::allow(std::string_view clientKey, SteadyTimePoint now) {
  if (!_config.enabled) {
    return true;
  }
  std::lock_guard<std::mutex> lock(_mutex);
  auto [it, inserted] = _windows.try_emplace(std::string(clientKey), Window{now, 0});
  Window& window = it->second;
  if (now - window.start > kWindow) {
    window.start = now;
    window.count = 0;
  }
  if (window.count < _config.requestsPerMinute) {
    ++window.count;
  } else {
    window.count = _config.requestsPerMinute + 1U;
  }
  const bool allowed = window.count <= _config.requestsPerMinute;
  if (_windows.size() > kPruneThreshold) {
    pruneExpired(now);
  }
  return allowed;
}

void RateLimiter::pruneExpired(SteadyTimePoint now) {
  const std::size_t before = _windows.size();
  std::erase_if(_windows, [now](const auto& entry) { return now - entry.second.start > kWindow; });
  log::debug("Pruned {} expired rate limit windows", before - _windows.size());
}

std::size_t RateLimiter::nbClients() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _windows.size();
}

std::string_view RateLimiter::ClientKey(const RequestContext& ctx) {
  if (auto forwarded = ctx.headerValue(http::XForwardedFor)) {
    const std::string_view first = Trim(forwarded->substr(0, forwarded->find(',')));
    if (!first.empty()) {
      return first;
    }
  }
  if (auto realIp = ctx.headerValue(http::XRealIp)) {
    const std::string_view ip = Trim(*realIp);
    if (!ip.empty()) {
      return ip;
    }
  }
  return ctx.peerAddress();
}

}  // namespace turbo
