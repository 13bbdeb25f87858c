#include "turbo/http-server.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

#include "turbo/base-fd.hpp"
#include "turbo/event-loop.hpp"
#include "turbo/event.hpp"
#include "turbo/execution-coordinator.hpp"
#include "turbo/http-constants.hpp"
#include "turbo/http-error.hpp"
#include "turbo/http-method.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/log.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/request-context.hpp"
#include "turbo/request-parser.hpp"
#include "turbo/request-task.hpp"
#include "turbo/signal-handler.hpp"
#include "turbo/socket-ops.hpp"
#include "turbo/socket.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

namespace {

constexpr std::size_t kReadChunkSize = 16UL * 1024;

HttpResponse InternalErrorResponse(const RequestContext& ctx) {
  return ExecutionCoordinator::ToResponse(MakeFailure(ErrorKind::HandlerException, "Internal server error"), ctx);
}

// Response of a finished async execution. An exception escaping the coroutine is answered 500.
HttpResponse TaskResponse(RequestTask<HttpResponse>& task, const RequestContext& ctx) {
  try {
    return task.result();
  } catch (const std::exception& ex) {
    log::error("Async execution of {} {} failed: {}", http::MethodToStr(ctx.method()), ctx.path(), ex.what());
    return InternalErrorResponse(ctx);
  }
}

}  // namespace

HttpServer::AsyncHandle::AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error)
    : _thread(std::move(thread)), _error(std::move(error)) {}

HttpServer::AsyncHandle::~AsyncHandle() { stop(); }

void HttpServer::AsyncHandle::stop() noexcept {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
  }
}

void HttpServer::AsyncHandle::rethrowIfError() {
  if (_error && *_error) {
    std::rethrow_exception(*_error);
  }
}

HttpServer::HttpServer(HttpServerConfig config, ExecutionCoordinator& coordinator)
    : _config(std::move(config)),
      _parserLimits{_config.maxHeaderBytes, _config.maxBodyBytes},
      _maxConnections(_config.effectiveMaxConnections()),
      _coordinator(&coordinator),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval),
      _maintenanceTimer(_config.pollInterval) {
  initListener();
}

HttpServer::~HttpServer() {
  closeAllConnections();
  closeListener();
}

void HttpServer::initListener() {
  _config.validate();

  _listenSocket.bindAndListen(_config.bindAddress, _config.reusePort, _config.tcpNoDelay, _config.port);

  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.wakeupFd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_resumeQueue.fd(), EventIn});

  // Drives idle sweeps and handler deadlines even when epoll_wait never times out under load.
  _eventLoop.addOrThrow(EventLoop::EventFd{_maintenanceTimer.fd(), EventIn});
}

void HttpServer::run() {
  runUntil([] { return false; });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (!_listenSocket) {
    throw std::logic_error("HttpServer cannot run again once stopped");
  }
  _lifecycle.enterRunning();
  log::debug("Server running on {}:{}", _config.bindAddress, port());
  while (_lifecycle.isActive() && !predicate()) {
    eventLoop();
  }
  closeAllConnections();
  closeListener();
  _lifecycle.reset();
  log::debug("Server on port :{} stopped", port());
}

HttpServer::AsyncHandle HttpServer::startDetached() {
  auto errorPtr = std::make_shared<std::exception_ptr>();

  return {std::jthread([this, errorPtr](const std::stop_token& st) {
            try {
              runUntil([&st]() { return st.stop_requested(); });
            } catch (...) {
              *errorPtr = std::current_exception();
            }
          }),
          std::move(errorPtr)};
}

void HttpServer::stop() noexcept {
  if (_lifecycle.requestStop() != internal::Lifecycle::State::Idle) {
    log::debug("Stopping server on port :{}", port());
  }
}

void HttpServer::beginDrain(std::chrono::milliseconds maxWait) noexcept {
  _drainRequestMs.store(std::max<int64_t>(maxWait.count(), 0), std::memory_order_relaxed);
  _lifecycle.wakeup();
}

void HttpServer::startDrain(std::chrono::milliseconds maxWait) {
  std::optional<SteadyTimePoint> deadline;
  if (maxWait.count() > 0) {
    deadline = std::chrono::steady_clock::now() + maxWait;
  }
  if (!_lifecycle.requestDrain(deadline)) {
    return;
  }
  if (!_connections.empty()) {
    log::info("Initiating graceful drain (connections={})", _connections.size());
  }
  // New connections are refused from now on.
  closeListener();
}

void HttpServer::eventLoop() {
  const auto events = _eventLoop.poll();

  bool maintenanceTick = false;

  if (events.data() == nullptr) [[unlikely]] {
    _lifecycle.requestStop();
  } else if (!events.empty()) {
    for (const auto& event : events) {
      const int fd = event.fd;
      if (fd == _listenSocket.fd()) {
        acceptNewConnections();
      } else if (fd == _lifecycle.wakeupFd()) {
        _lifecycle.consumeWakeups();
      } else if (fd == _resumeQueue.fd()) {
        _resumeQueue.drain([this](uint64_t tag) { onExecutionResumed(tag); });
      } else if (fd == _maintenanceTimer.fd()) {
        const uint64_t ticks = _maintenanceTimer.consumeTicks();
        if (ticks > 1U) {
          log::trace("Event loop of port {} lagged {} maintenance periods", port(), ticks - 1U);
        }
        maintenanceTick = true;
      } else {
        const auto bmp = event.eventBmp;
        if ((bmp & EventOut) != 0) {
          handleWritableClient(fd);
        }
        // EPOLLERR/EPOLLHUP can be delivered without EPOLLIN.
        if ((bmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
          handleReadableClient(fd, bmp);
        }
      }
    }
  } else {
    // timeout or EINTR
    maintenanceTick = true;
  }

  const auto now = std::chrono::steady_clock::now();
  if (maintenanceTick) {
    _resumeQueue.expire(now, [this](uint64_t tag) { onExecutionResumed(tag); });
    sweepIdleConnections(now);
  }
  updateLifecycle(now);
  publishCounters();
}

void HttpServer::publishCounters() noexcept {
  _nbConnectionsSnapshot.store(_connections.size(), std::memory_order_relaxed);
  _nbPendingSnapshot.store(_resumeQueue.nbPending(), std::memory_order_relaxed);
}

void HttpServer::updateLifecycle(SteadyTimePoint now) {
  const int64_t drainRequestMs = _drainRequestMs.exchange(-1, std::memory_order_relaxed);
  if (drainRequestMs >= 0) {
    startDrain(std::chrono::milliseconds{drainRequestMs});
  }

  if (_lifecycle.isStopping()) {
    closeAllConnections();
    closeListener();
    _lifecycle.reset();
    log::debug("Server on port :{} stopped", port());
  } else if (_lifecycle.isDraining()) {
    if (_connections.empty()) {
      _lifecycle.reset();
      log::debug("Server on port :{} drained", port());
    } else if (_lifecycle.drainExpired(now)) {
      log::warn("Drain deadline reached with {} active connection(s); forcing close", _connections.size());
      closeAllConnections();
      _lifecycle.reset();
    }
  } else if (_lifecycle.isRunning() && SignalHandler::IsStopRequested()) {
    log::debug("Signal {} received, draining port {}", SignalHandler::StopSignal(), port());
    startDrain(SignalHandler::MaxDrainPeriod());
  }
}

void HttpServer::acceptNewConnections() {
  while (_listenSocket) {
    std::string peerAddress;
    BaseFd cnxFd(AcceptNonBlocking(_listenSocket.fd(), peerAddress));
    if (!cnxFd) {
      const auto err = errno;
      if (err != EAGAIN && err != EWOULDBLOCK) {
        log::error("accept failed on port :{} err={} ({})", port(), err, std::strerror(err));
      }
      break;
    }
    const int fd = cnxFd.fd();

    if (_connections.size() >= _maxConnections) {
      std::string out;
      ResponseWireOptions options;
      options.keepAlive = false;
      options.globalHeaders = _config.globalHeaders;
      AppendResponseWire(out, MakeProtocolErrorResponse(http::StatusCodeServiceUnavailable), options);
      if (SafeSend(fd, out) == -1) {
        log::debug("Unable to send 503 to rejected fd # {}", fd);
      }
      log::warn("Connection limit of {} reached, rejecting client {}", _maxConnections, peerAddress);
      continue;
    }

    if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
      const auto err = errno;
      log::error("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", fd, err, std::strerror(err));
    }
    if (!_eventLoop.add(EventLoop::EventFd{fd, EventIn})) {
      continue;
    }

    auto state = std::make_unique<ConnectionState>();
    state->fd = std::move(cnxFd);
    state->peerAddress = std::move(peerAddress);
    state->generation = ++_nextGeneration;
    state->lastActivity = std::chrono::steady_clock::now();
    state->events = EventIn;
    log::trace("Accepted fd # {} from {}", fd, state->peerAddress);
    _connections.emplace(fd, std::move(state));
  }
}

void HttpServer::handleReadableClient(int fd, EventBmp eventBmp) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;
  if (state.task || state.peerClosed) {
    // Not reading: only an error or a hang up can be reported here.
    if ((eventBmp & (EventErr | EventHup)) != 0) {
      log::debug("Peer of fd # {} hung up with a request in flight", fd);
      closeConnection(cnxIt);
    }
    return;
  }

  const std::size_t maxBuffered = _parserLimits.maxHeaderBytes + _parserLimits.maxBodyBytes;
  while (state.inBuffer.size() < maxBuffered) {
    const std::size_t oldSize = state.inBuffer.size();
    state.inBuffer.resize(oldSize + kReadChunkSize);
    const auto nbRead = ::read(fd, state.inBuffer.data() + oldSize, kReadChunkSize);
    if (nbRead > 0) {
      state.inBuffer.resize(oldSize + static_cast<std::size_t>(nbRead));
      if (static_cast<std::size_t>(nbRead) < kReadChunkSize) {
        break;
      }
      continue;
    }
    state.inBuffer.resize(oldSize);
    if (nbRead == 0) {
      state.peerClosed = true;
      break;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      break;
    }
    log::debug("read failed on fd # {} err={} ({})", fd, err, std::strerror(err));
    closeConnection(cnxIt);
    return;
  }
  state.lastActivity = std::chrono::steady_clock::now();

  if (!processRequests(state)) {
    return;
  }
  if (state.peerClosed && !state.task && state.outBuffer.empty()) {
    closeConnection(fd);
  }
}

void HttpServer::handleWritableClient(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt != _connections.end()) {
    flush(*cnxIt->second);
  }
}

bool HttpServer::processRequests(ConnectionState& state) {
  const int fd = state.fd.fd();
  while (!state.task && !state.closeAfterWrite && !state.inBuffer.empty()) {
    const http::ParseResult res = http::ParseRequest(state.inBuffer, _parserLimits, state.ctx);
    if (res.status == http::ParseResult::Status::NeedMore) {
      if (res.expectContinue && !state.continueSent) {
        state.outBuffer.append(http::HTTP11_100_CONTINUE);
        state.continueSent = true;
      }
      break;
    }
    if (res.status == http::ParseResult::Status::Error) {
      log::debug("Invalid request on fd # {}, answering {}", fd, res.errorStatus);
      queueResponse(state, MakeProtocolErrorResponse(res.errorStatus), false, false);
      state.inBuffer.clear();
      break;
    }

    state.inBuffer.erase(0, res.consumed);
    state.continueSent = false;
    ++state.nbRequests;
    state.ctx.setPeerAddress(state.peerAddress);

    const bool keepAlive = _config.enableKeepAlive && state.ctx.keepAlive() && !state.peerClosed &&
                           state.nbRequests < _config.maxRequestsPerConnection && _lifecycle.isRunning();

    ExecutionCoordinator::Dispatch dispatched;
    try {
      dispatched = _coordinator->dispatch(state.ctx, ResumeTarget{&_resumeQueue, TagOf(state)});
    } catch (const std::exception& ex) {
      log::error("Dispatch of {} {} failed: {}", http::MethodToStr(state.ctx.method()), state.ctx.path(), ex.what());
      dispatched = InternalErrorResponse(state.ctx);
    }

    if (auto* pResponse = std::get_if<HttpResponse>(&dispatched)) {
      queueResponse(state, *pResponse, keepAlive, state.ctx.isHead());
      continue;
    }

    auto& task = std::get<RequestTask<HttpResponse>>(dispatched);
    task.resume();
    if (task.done()) {
      queueResponse(state, TaskResponse(task, state.ctx), keepAlive, state.ctx.isHead());
      continue;
    }
    state.task.emplace(std::move(task));
    state.keepAliveAfterTask = keepAlive;
  }
  return flush(state);
}

void HttpServer::onExecutionResumed(uint64_t tag) {
  const int fd = static_cast<int>(tag & 0xFFFFFFFFU);
  const auto generation = static_cast<uint32_t>(tag >> 32U);
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end() || cnxIt->second->generation != generation || !cnxIt->second->task) {
    log::debug("Execution resumed for closed connection fd # {}", fd);
    return;
  }
  ConnectionState& state = *cnxIt->second;
  if (!state.task->done()) {
    // suspended again, it will be resumed later
    return;
  }
  const HttpResponse response = TaskResponse(*state.task, state.ctx);
  state.task.reset();
  const bool keepAlive = state.keepAliveAfterTask && !state.peerClosed && _lifecycle.isRunning();
  queueResponse(state, response, keepAlive, state.ctx.isHead());
  if (!processRequests(state)) {
    return;
  }
  if (state.peerClosed && !state.task && state.outBuffer.empty()) {
    closeConnection(fd);
  }
}

void HttpServer::queueResponse(ConnectionState& state, const HttpResponse& response, bool keepAlive,
                               bool headRequest) {
  ResponseWireOptions options;
  options.keepAlive = keepAlive;
  options.headRequest = headRequest;
  options.globalHeaders = _config.globalHeaders;
  AppendResponseWire(state.outBuffer, response, options);
  if (!keepAlive) {
    state.closeAfterWrite = true;
  }
  log::debug("{} {} -> {}", http::MethodToStr(state.ctx.method()), state.ctx.path(), response.status());
}

bool HttpServer::flush(ConnectionState& state) {
  const int fd = state.fd.fd();
  while (state.outOffset < state.outBuffer.size()) {
    const auto remaining = std::string_view(state.outBuffer).substr(state.outOffset);
    const int64_t nbSent = SafeSend(fd, remaining);
    if (nbSent >= 0) {
      state.outOffset += static_cast<std::size_t>(nbSent);
      continue;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      break;
    }
    log::debug("send failed on fd # {} err={} ({})", fd, err, std::strerror(err));
    closeConnection(fd);
    return false;
  }

  if (!state.outBuffer.empty() && state.outOffset == state.outBuffer.size()) {
    state.outBuffer.clear();
    state.outOffset = 0;
    state.lastActivity = std::chrono::steady_clock::now();
    if (state.closeAfterWrite) {
      ShutdownWrite(fd);
      closeConnection(fd);
      return false;
    }
  }

  if (!updateInterest(state)) {
    closeConnection(fd);
    return false;
  }
  return true;
}

bool HttpServer::updateInterest(ConnectionState& state) {
  EventBmp wanted = 0;
  if (!state.task && !state.peerClosed && !state.closeAfterWrite) {
    wanted |= EventIn;
  }
  if (state.outOffset < state.outBuffer.size()) {
    wanted |= EventOut;
  }
  if (wanted == state.events) {
    return true;
  }
  if (!_eventLoop.mod(EventLoop::EventFd{state.fd.fd(), wanted})) {
    return false;
  }
  state.events = wanted;
  return true;
}

void HttpServer::sweepIdleConnections(SteadyTimePoint now) {
  const bool draining = _lifecycle.isDraining();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    const ConnectionState& state = *cnxIt->second;
    if (state.task) {
      // handler deadlines are enforced by the resume queue
      ++cnxIt;
      continue;
    }
    const bool idle = state.outBuffer.empty() && state.inBuffer.empty();
    if (draining && idle) {
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    // Also bounds the time a client may take to send a complete request.
    if (now > state.lastActivity + _config.keepAliveTimeout) {
      log::trace("Closing inactive fd # {}", cnxIt->first);
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    ++cnxIt;
  }
}

void HttpServer::closeConnection(int fd) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt != _connections.end()) {
    closeConnection(cnxIt);
  }
}

HttpServer::ConnectionMap::iterator HttpServer::closeConnection(ConnectionMap::iterator cnxIt) {
  const int fd = cnxIt->first;
  _eventLoop.del(fd);
  log::trace("Closing fd # {}", fd);
  // Destroys the suspended execution, if any, which cancels it.
  return _connections.erase(cnxIt);
}

void HttpServer::closeAllConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

void HttpServer::closeListener() noexcept {
  if (_listenSocket) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
  }
}

uint64_t HttpServer::TagOf(const ConnectionState& state) noexcept {
  return (static_cast<uint64_t>(state.generation) << 32U) | static_cast<uint32_t>(state.fd.fd());
}

}  // namespace turbo
