#include "turbo/multi-http-server.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "turbo/errno-throw.hpp"
#include "turbo/execution-coordinator.hpp"
#include "turbo/execution-lock.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/http-server.hpp"
#include "turbo/log.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/scheduler.hpp"
#include "turbo/signal-handler.hpp"
#include "turbo/socket.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo {

namespace {

// Validates the configuration, freezes the registry and applies the rate limiting settings of the application,
// unless the server configuration enables rate limiting itself.
RateLimitConfig ResolveRateLimit(const HttpServerConfig& config, HandlerRegistry& registry) {
  config.validate();

  RateLimitConfig rateLimit = config.rateLimit;
  ExecutionLock lock;
  const AppSettings& settings = DefaultAppSettings();
  if (settings.rateLimitConfigured && !rateLimit.enabled) {
    rateLimit.enabled = settings.rateLimitEnabled;
    rateLimit.requestsPerMinute = settings.requestsPerMinute;
  }
  registry.freeze();
  return rateLimit;
}

}  // namespace

void MultiHttpServer::AsyncHandle::stop() noexcept {
  // wake up all the reactors first, then join them
  std::ranges::for_each(_servers, [](HttpServer* server) { server->stop(); });
  std::ranges::for_each(_serverHandles, [](HttpServer::AsyncHandle& handle) { handle.stop(); });
  _servers.clear();
}

void MultiHttpServer::AsyncHandle::rethrowIfError() {
  for (HttpServer::AsyncHandle& handle : _serverHandles) {
    handle.rethrowIfError();
  }
}

bool MultiHttpServer::AsyncHandle::started() const noexcept {
  return std::ranges::any_of(_serverHandles, [](const HttpServer::AsyncHandle& handle) { return handle.started(); });
}

MultiHttpServer::MultiHttpServer(HttpServerConfig config, HandlerRegistry& registry)
    : _config(std::move(config)),
      _rateLimiter(ResolveRateLimit(_config, registry)),
      _coordinator(registry, ExecutionOptions{_config.handlerTimeout, _config.timeoutStatus},
                   _rateLimiter.enabled() ? &_rateLimiter : nullptr) {
  const uint32_t nbThreads = _config.effectiveNbThreads();
  const uint32_t maxConnections = _config.effectiveMaxConnections();

  HttpServerConfig serverConfig = _config;
  serverConfig.rateLimit = _rateLimiter.config();
  serverConfig.maxConnections = std::max(1U, (maxConnections + nbThreads - 1U) / nbThreads);
  if (nbThreads > 1U && !_config.reusePort) {
    if (_config.port != 0) {
      // SO_REUSEPORT is needed by the reactors, make sure that no other process already uses the port.
      if (!Socket{Socket::Type::StreamNonBlock}.tryBind(_config.bindAddress, false, false, _config.port)) {
        throw_errno("bind failed on port {} - already in use", _config.port);
      }
    }
    serverConfig.reusePort = true;
  }

  _servers.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _servers.push_back(std::make_unique<HttpServer>(serverConfig, _coordinator));
    // the first reactor resolves the ephemeral port
    serverConfig.port = _servers.front()->port();
  }

  _config = serverConfig;
  _config.nbThreads = nbThreads;
  _config.maxConnections = maxConnections;

  SetServerDescription(fmt::format("{}:{}", _config.bindAddress, _config.port), nbThreads);
  log::info("turbo listening on {}:{} with {} thread(s), {} max connection(s)", _config.bindAddress, _config.port,
            nbThreads, maxConnections);
}

MultiHttpServer::~MultiHttpServer() { SetServerDescription({}, 0); }

MultiHttpServer::AsyncHandle MultiHttpServer::start() {
  std::vector<HttpServer*> servers;
  std::vector<HttpServer::AsyncHandle> handles;
  servers.reserve(_servers.size());
  handles.reserve(_servers.size());
  for (const auto& server : _servers) {
    servers.push_back(server.get());
    handles.push_back(server->startDetached());
  }
  return {std::move(servers), std::move(handles)};
}

void MultiHttpServer::run() {
  const SignalHandler signalHandler(_config.drainTimeout);

  std::vector<std::exception_ptr> errors(_servers.size());
  const auto runServer = [this, &errors](std::size_t serverPos) {
    try {
      _servers[serverPos]->run();
    } catch (...) {
      errors[serverPos] = std::current_exception();
      log::critical("Reactor #{} failed, stopping the server", serverPos);
      std::ranges::for_each(_servers, [](const auto& server) { server->stop(); });
    }
  };

  {
    std::vector<std::jthread> threads;
    threads.reserve(_servers.size());
    for (std::size_t serverPos = 1; serverPos < _servers.size(); ++serverPos) {
      threads.emplace_back(runServer, serverPos);
    }
    runServer(0);
  }

  if (SignalHandler::IsStopRequested()) {
    log::info("turbo stopped by signal {}, shutting down the scheduler", SignalHandler::StopSignal());
  } else {
    log::info("turbo stopped, shutting down the scheduler");
  }
  Scheduler::Shutdown();

  for (const std::exception_ptr& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

void MultiHttpServer::beginDrain(std::chrono::milliseconds maxWait) noexcept {
  std::ranges::for_each(_servers, [maxWait](const auto& server) { server->beginDrain(maxWait); });
}

}  // namespace turbo
