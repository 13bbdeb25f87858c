#include "turbo/test-server.hpp"

#include <chrono>
#include <utility>

#include "turbo/execution-coordinator.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/http-server.hpp"

namespace turbo::test {

HttpServerConfig TestServer::PrepareConfig(HttpServerConfig config) {
  config.bindAddress = "127.0.0.1";
  config.port = 0;
  if (config.pollInterval > std::chrono::milliseconds{10}) {
    config.pollInterval = std::chrono::milliseconds{10};
  }
  return config;
}

TestServer::TestServer(HttpServerConfig config, const HandlerRegistry& registry)
    : _config(PrepareConfig(std::move(config))),
      _rateLimiter(_config.rateLimit),
      _coordinator(registry, ExecutionOptions{_config.handlerTimeout, _config.timeoutStatus},
                   _rateLimiter.enabled() ? &_rateLimiter : nullptr),
      _server(_config, _coordinator),
      _handle(_server.startDetached()) {}

TestServer::~TestServer() {
  _server.stop();
  _handle.stop();
}

void TestServer::stop() {
  _server.stop();
  _handle.stop();
  _handle.rethrowIfError();
}

}  // namespace turbo::test
