#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/rate-limiter.hpp"

namespace turbo {

struct HttpServerConfig {
  static constexpr uint32_t kConnectionsPerThread = 50;

  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{0};

  // IPv4 address to bind, in dotted decimal notation.
  std::string bindAddress{"0.0.0.0"};

  // If true, enables SO_REUSEPORT allowing multiple independent HttpServer instances (one per thread)
  // to bind the same port for load distribution by the kernel. Forced by MultiHttpServer.
  bool reusePort{false};

  // Disables the Nagle algorithm on accepted connections.
  bool tcpNoDelay{false};

  // Number of reactor threads of a MultiHttpServer. 0 means clamp(3 * hardware_concurrency, 8, 24).
  uint32_t nbThreads{0};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  bool enableKeepAlive{true};

  // Maximum number of HTTP requests to serve over a single persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{1000};

  // Idle timeout for keep-alive connections. Once exceeded the server proactively closes the connection.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{5}};

  // Maximum number of open connections, all threads included. Connections beyond are answered 503 and closed.
  // 0 means nbThreads * 50 * 11 / 10. MultiHttpServer splits it evenly across its threads.
  uint32_t maxConnections{0};

  // ============================
  // Request parsing & body limits
  // ============================
  std::size_t maxHeaderBytes{8UL * 1024};
  std::size_t maxBodyBytes{1UL << 20};

  // ===========================================
  // Handler execution
  // ===========================================
  // Deadline of async handlers, from their submission. 0 disables it.
  std::chrono::milliseconds handlerTimeout{std::chrono::seconds{30}};

  // Status answered when an async handler misses its deadline.
  http::StatusCode timeoutStatus{http::StatusCodeGatewayTimeout};

  // Maximum duration the event loop blocks in epoll_wait when idle, before housekeeping (idle connections,
  // handler deadlines, stop requests).
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{50}};

  // Maximum duration of the graceful drain when stopping: in-flight requests are given this long to complete.
  std::chrono::milliseconds drainTimeout{std::chrono::seconds{5}};

  RateLimitConfig rateLimit;

  // Headers added to all responses. Defaults to a single "Server: turbo" entry.
  std::vector<HttpResponse::Header> globalHeaders{{"Server", "turbo"}};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Number of threads to use, resolving the default.
  [[nodiscard]] uint32_t effectiveNbThreads() const noexcept;

  // Maximum number of connections of the whole server, resolving the default.
  [[nodiscard]] uint32_t effectiveMaxConnections() const noexcept;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withBindAddress(std::string address);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withNbThreads(uint32_t nbThreads);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withMaxConnections(uint32_t maxConnections);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withHandlerTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withTimeoutStatus(http::StatusCode status);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withDrainTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withRateLimit(RateLimitConfig config);

  // Replace the global response headers list
  HttpServerConfig& withGlobalHeaders(std::vector<HttpResponse::Header> headers);

  // Add a single global header entry (appended)
  HttpServerConfig& withGlobalHeader(HttpResponse::Header header);
};

}  // namespace turbo
