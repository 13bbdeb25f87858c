#include "turbo/http-server-config.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "turbo/http-constants.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/string-equal-ignore-case.hpp"

namespace turbo {

namespace {

bool IsTokenChar(char ch) {
  static constexpr std::string_view kSpecials = "!#$%&'*+-.^_`|~";
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
         kSpecials.find(ch) != std::string_view::npos;
}

bool IsValidHeaderName(std::string_view name) { return !name.empty() && std::ranges::all_of(name, IsTokenChar); }

bool IsValidHeaderValue(std::string_view value) {
  return std::ranges::none_of(value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; });
}

// Headers computed by the server for each response.
bool IsReservedResponseHeader(std::string_view name) {
  for (std::string_view reserved : {http::ContentLength, http::Connection, http::Date, http::TransferEncoding}) {
    if (CaseInsensitiveEqual(name, reserved)) {
      return true;
    }
  }
  return false;
}

}  // namespace

void HttpServerConfig::validate() const {
  in_addr addr{};
  if (::inet_pton(AF_INET, bindAddress.c_str(), &addr) != 1) {
    throw std::invalid_argument(fmt::format("invalid IPv4 bind address '{}'", bindAddress));
  }
  if (maxHeaderBytes < 128U) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (handlerTimeout.count() < 0) {
    throw std::invalid_argument("handlerTimeout must be non-negative");
  }
  if (drainTimeout.count() < 0) {
    throw std::invalid_argument("drainTimeout must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (timeoutStatus < 400 || timeoutStatus > http::kMaxStatusCode) {
    throw std::invalid_argument(fmt::format("timeoutStatus {} is not an error status", timeoutStatus));
  }
  rateLimit.validate();

  for (const auto& [name, value] : globalHeaders) {
    if (IsReservedResponseHeader(name)) {
      throw std::invalid_argument(fmt::format("attempt to set reserved header: '{}'", name));
    }
    if (!IsValidHeaderName(name)) {
      throw std::invalid_argument(fmt::format("header has invalid name: '{}'", name));
    }
    if (!IsValidHeaderValue(value)) {
      throw std::invalid_argument(fmt::format("header has invalid value: '{}'", value));
    }
  }
}

uint32_t HttpServerConfig::effectiveNbThreads() const noexcept {
  if (nbThreads != 0) {
    return nbThreads;
  }
  const uint32_t nbCores = std::thread::hardware_concurrency();
  return std::clamp(nbCores * 3U, 8U, 24U);
}

uint32_t HttpServerConfig::effectiveMaxConnections() const noexcept {
  if (maxConnections != 0) {
    return maxConnections;
  }
  return effectiveNbThreads() * kConnectionsPerThread * 11U / 10U;
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBindAddress(std::string address) {
  this->bindAddress = std::move(address);
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNbThreads(uint32_t nbThreads) {
  this->nbThreads = nbThreads;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxConnections(uint32_t maxConnections) {
  this->maxConnections = maxConnections;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withHandlerTimeout(std::chrono::milliseconds timeout) {
  this->handlerTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTimeoutStatus(http::StatusCode status) {
  this->timeoutStatus = status;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDrainTimeout(std::chrono::milliseconds timeout) {
  this->drainTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withRateLimit(RateLimitConfig config) {
  this->rateLimit = config;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeaders(std::vector<HttpResponse::Header> headers) {
  this->globalHeaders = std::move(headers);
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeader(HttpResponse::Header header) {
  this->globalHeaders.push_back(std::move(header));
  return *this;
}

}  // namespace turbo
