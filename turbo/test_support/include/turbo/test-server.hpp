#pragma once

#include <cstdint>

#include "turbo/execution-coordinator.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/http-server.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo::test {

// RAII test server: an HttpServer bound to an ephemeral loopback port, with its own ExecutionCoordinator over
// 'registry', running on a background thread until destruction.
//
// Usage pattern:
//   RunPython("import turbo\n@turbo.get('/')\ndef root():\n    return 'ok'\n");
//   TestServer ts;
//   auto resp = simpleGet(ts.port(), "/");
class TestServer {
 public:
  explicit TestServer(HttpServerConfig config = {}, const HandlerRegistry& registry = DefaultRegistry());

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) = delete;

  ~TestServer();

  [[nodiscard]] uint16_t port() const noexcept { return _server.port(); }

  [[nodiscard]] const ExecutionCoordinator& coordinator() const noexcept { return _coordinator; }

  [[nodiscard]] HttpServer& server() noexcept { return _server; }

  // Stops the server and joins its thread, rethrowing what escaped its event loop. Idempotent.
  void stop();

 private:
  static HttpServerConfig PrepareConfig(HttpServerConfig config);

  HttpServerConfig _config;
  RateLimiter _rateLimiter;
  ExecutionCoordinator _coordinator;
  HttpServer _server;
  HttpServer::AsyncHandle _handle;
};

}  // namespace turbo::test
