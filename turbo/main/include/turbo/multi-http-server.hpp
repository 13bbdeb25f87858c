#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "turbo/execution-coordinator.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/http-server.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo {

// Pool of HttpServer reactors, one per thread, listening on the same port through SO_REUSEPORT and sharing one
// ExecutionCoordinator (and rate limiter) over a frozen HandlerRegistry.
//
// Construction requires an active PythonRuntime: it freezes the registry, merges the rate limiting settings of
// the application (turbo.configure_rate_limiting) into the configuration and publishes the listening address for
// turbo.info().
//
// Typical usage:
//   PythonRuntime runtime;
//   runtime.runFile("app.py");
//   MultiHttpServer server(HttpServerConfig{}.withPort(8000));
//   server.run();  // until SIGINT / SIGTERM
class MultiHttpServer {
 public:
  // Stops and joins all the reactors of a started server when destroyed.
  class AsyncHandle {
   public:
    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;

    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    ~AsyncHandle() { stop(); }

    // Stop all the reactors and join their threads. Idempotent.
    void stop() noexcept;

    // Rethrows the first exception that escaped a reactor thread, if any.
    void rethrowIfError();

    [[nodiscard]] bool started() const noexcept;

   private:
    friend class MultiHttpServer;

    AsyncHandle(std::vector<HttpServer*> servers, std::vector<HttpServer::AsyncHandle> serverHandles) noexcept
        : _servers(std::move(servers)), _serverHandles(std::move(serverHandles)) {}

    std::vector<HttpServer*> _servers;
    std::vector<HttpServer::AsyncHandle> _serverHandles;
  };

  // Binds config.effectiveNbThreads() listeners on the same port (chosen by the first one if config.port is 0).
  // Throws std::invalid_argument for invalid configuration and std::system_error if a socket cannot be set up.
  explicit MultiHttpServer(HttpServerConfig config, HandlerRegistry& registry = DefaultRegistry());

  MultiHttpServer(const MultiHttpServer&) = delete;
  MultiHttpServer(MultiHttpServer&&) = delete;
  MultiHttpServer& operator=(const MultiHttpServer&) = delete;
  MultiHttpServer& operator=(MultiHttpServer&&) = delete;

  ~MultiHttpServer();

  // Starts every reactor on its own thread and returns immediately. The handle must not outlive the server.
  [[nodiscard]] AsyncHandle start();

  // Serves until SIGINT or SIGTERM, then drains for at most config.drainTimeout and tears down the scheduler.
  // Rethrows the first exception that escaped a reactor.
  void run();

  // Starts a graceful drain of all the reactors. Thread safe.
  void beginDrain(std::chrono::milliseconds maxWait) noexcept;

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] uint32_t nbThreads() const noexcept { return static_cast<uint32_t>(_servers.size()); }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const ExecutionCoordinator& coordinator() const noexcept { return _coordinator; }

  [[nodiscard]] const RateLimiter& rateLimiter() const noexcept { return _rateLimiter; }

 private:
  HttpServerConfig _config;
  RateLimiter _rateLimiter;
  ExecutionCoordinator _coordinator;
  std::vector<std::unique_ptr<HttpServer>> _servers;
};

}  // namespace turbo
