#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "turbo/base-fd.hpp"
#include "turbo/event-loop.hpp"
#include "turbo/event.hpp"
#include "turbo/execution-coordinator.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/internal/lifecycle.hpp"
#include "turbo/request-context.hpp"
#include "turbo/request-parser.hpp"
#include "turbo/request-task.hpp"
#include "turbo/resume-queue.hpp"
#include "turbo/socket.hpp"
#include "turbo/timedef.hpp"
#include "turbo/timer-fd.hpp"

namespace turbo {

// Single threaded HTTP/1.1 server: one epoll reactor owning a listening socket, its accepted connections and
// the resume queue of the async executions started by those connections.
//
// Requests are executed through the ExecutionCoordinator, shared with the other reactors of a MultiHttpServer.
// Sync handlers run inline on the reactor thread. Async handlers suspend their connection (no further request is
// read from it) until the scheduler posts their completion to the resume queue, so responses always go out in
// request order.
//
// Not thread safe, except stop() and beginDrain() which may be called from any thread.
class HttpServer {
 public:
  // RAII wrapper of a server running on a background thread (see startDetached()).
  // The destructor stops the server and joins the thread.
  class AsyncHandle {
   public:
    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;

    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    ~AsyncHandle();

    // Stop the background event loop and join the thread (blocking).
    // Safe to call multiple times; subsequent calls are no-ops.
    void stop() noexcept;

    // Rethrow any exception that occurred in the background event loop.
    void rethrowIfError();

    [[nodiscard]] bool started() const noexcept { return _thread.joinable(); }

   private:
    friend class HttpServer;

    AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error);

    std::jthread _thread;
    std::shared_ptr<std::exception_ptr> _error;
  };

  // Validates the configuration, binds and listens. If config.port is 0 an ephemeral port is chosen,
  // available through port().
  // Throws std::invalid_argument for invalid configuration and std::system_error if the socket cannot be set up.
  HttpServer(HttpServerConfig config, ExecutionCoordinator& coordinator);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  // Runs the event loop on the calling thread until stop() or the end of a drain.
  void run();

  // Same as run(), but also returns as soon as 'predicate' returns true (checked after each loop iteration).
  // Open connections are closed when returning.
  void runUntil(const std::function<bool()>& predicate);

  // Runs the event loop on a new thread. Stop it with the returned handle.
  [[nodiscard]] AsyncHandle startDetached();

  // Closes the listener and all connections, abandoning in-flight executions. Thread safe.
  void stop() noexcept;

  // Stops accepting connections and closes them as they become idle. In-flight requests are completed and
  // answered with 'Connection: close'. Once maxWait is elapsed (0: no limit), remaining connections are closed.
  // Thread safe.
  void beginDrain(std::chrono::milliseconds maxWait) noexcept;

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] bool isRunning() const noexcept { return _lifecycle.isRunning(); }

  [[nodiscard]] bool isDraining() const noexcept { return _lifecycle.isDraining(); }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  // Number of open client connections, as of the end of the last event loop iteration. Thread safe.
  [[nodiscard]] std::size_t nbConnections() const noexcept {
    return _nbConnectionsSnapshot.load(std::memory_order_relaxed);
  }

  // Number of suspended async executions, as of the end of the last event loop iteration. Thread safe.
  [[nodiscard]] std::size_t nbPendingExecutions() const noexcept {
    return _nbPendingSnapshot.load(std::memory_order_relaxed);
  }

 private:
  struct ConnectionState {
    BaseFd fd;
    std::string peerAddress;
    std::string inBuffer;
    std::string outBuffer;
    std::size_t outOffset{};
    RequestContext ctx;
    // Async execution of the current request, if suspended.
    std::optional<RequestTask<HttpResponse>> task;
    SteadyTimePoint lastActivity;
    uint32_t generation{};
    uint32_t nbRequests{};
    EventBmp events{};
    bool keepAliveAfterTask{true};
    bool continueSent{false};
    bool closeAfterWrite{false};
    // End of stream received, the pending request (if any) is still answered.
    bool peerClosed{false};
  };

  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionState>>;

  void initListener();

  void eventLoop();

  // Applies stop and drain requests and ends the run once stopped or drained.
  void updateLifecycle(SteadyTimePoint now);

  void startDrain(std::chrono::milliseconds maxWait);

  void acceptNewConnections();

  void handleReadableClient(int fd, EventBmp eventBmp);

  void handleWritableClient(int fd);

  // Parses and executes the buffered requests of the connection until one suspends, more bytes are needed or
  // the connection must close. Returns false if the connection was closed.
  bool processRequests(ConnectionState& state);

  void onExecutionResumed(uint64_t tag);

  void queueResponse(ConnectionState& state, const HttpResponse& response, bool keepAlive, bool headRequest);

  // Sends buffered output. Returns false if the connection was closed.
  bool flush(ConnectionState& state);

  // Updates the epoll interest of the connection to its current needs. Returns false on failure.
  bool updateInterest(ConnectionState& state);

  void sweepIdleConnections(SteadyTimePoint now);

  void closeConnection(int fd);

  ConnectionMap::iterator closeConnection(ConnectionMap::iterator cnxIt);

  void closeAllConnections();

  void closeListener() noexcept;

  void publishCounters() noexcept;

  [[nodiscard]] static uint64_t TagOf(const ConnectionState& state) noexcept;

  HttpServerConfig _config;
  http::ParserLimits _parserLimits;
  uint32_t _maxConnections;
  ExecutionCoordinator* _coordinator;
  Socket _listenSocket;
  EventLoop _eventLoop;
  TimerFd _maintenanceTimer;
  internal::Lifecycle _lifecycle;
  uint32_t _nextGeneration{};
  // Declared before the connections so that suspended executions are destroyed before their queue.
  ResumeQueue _resumeQueue;
  ConnectionMap _connections;
  // Drain requested from another thread, in milliseconds. Negative when none.
  std::atomic<int64_t> _drainRequestMs{-1};
  std::atomic<std::size_t> _nbConnectionsSnapshot{0};
  std::atomic<std::size_t> _nbPendingSnapshot{0};
};

}  // namespace turbo
