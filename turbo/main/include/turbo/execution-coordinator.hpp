#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <variant>

#include "turbo/handler-entry.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-error.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/python-error.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/request-context.hpp"
#include "turbo/request-task.hpp"

namespace turbo {

struct ExecutionOptions {
  // Deadline of async handlers, from their submission. 0 disables it.
  std::chrono::milliseconds handlerTimeout{std::chrono::seconds{30}};
  http::StatusCode timeoutStatus{http::StatusCodeGatewayTimeout};
};

// Counters of the requests handled by a coordinator. Relaxed atomics, for observability only.
struct ExecutionStats {
  std::atomic<uint64_t> nbDispatched{0};
  std::atomic<uint64_t> nbSync{0};
  std::atomic<uint64_t> nbAsync{0};
  std::atomic<uint64_t> nbNotFound{0};
  std::atomic<uint64_t> nbMethodNotAllowed{0};
  std::atomic<uint64_t> nbValidationErrors{0};
  std::atomic<uint64_t> nbHandlerErrors{0};
  std::atomic<uint64_t> nbTimedOut{0};
  std::atomic<uint64_t> nbUnavailable{0};
  std::atomic<uint64_t> nbRateLimited{0};
};

// Routes requests to their Python handler and turns whatever happens into a response.
//
// Sync handlers run inline on the calling thread with the execution lock held only around the call and the
// normalization of its result. The scheduler is never involved.
// Async handlers are called with the lock held to build their coroutine only; the coroutine is then submitted
// to the Scheduler and awaited, lock released, in a RequestTask resumed by the caller's ResumeQueue.
//
// The coordinator is shared by all reactor threads of a server: dispatch is const-correct on the registry and
// thread safe.
class ExecutionCoordinator {
 public:
  using Dispatch = std::variant<HttpResponse, RequestTask<HttpResponse>>;

  explicit ExecutionCoordinator(const HandlerRegistry& registry, ExecutionOptions options = {},
                                RateLimiter* rateLimiter = nullptr);

  // Executes 'ctx'. Returns the response right away for sync handlers and for requests failing before any
  // handler runs. Otherwise returns a not yet started task: the caller starts it with resume(), and it completes
  // after being resumed by target.queue. 'ctx' must outlive the returned task.
  // Path parameters of the matched route are added to 'ctx'.
  [[nodiscard]] Dispatch dispatch(RequestContext& ctx, ResumeTarget target);

  // Converts a failure to its JSON error response.
  [[nodiscard]] static HttpResponse ToResponse(const Failure& failure, const RequestContext& ctx);

  [[nodiscard]] const ExecutionStats& stats() const noexcept { return _stats; }

  [[nodiscard]] const ExecutionOptions& options() const noexcept { return _options; }

 private:
  Outcome executeSync(const HandlerEntry& entry, const RequestContext& ctx);

  RequestTask<HttpResponse> executeAsync(const HandlerEntry& entry, const RequestContext& ctx, ResumeTarget target);

  Failure handlerFailure(const HandlerEntry& entry, const PythonError& error);

  const HandlerRegistry& _registry;
  ExecutionOptions _options;
  RateLimiter* _rateLimiter;
  ExecutionStats _stats;
};

}  // namespace turbo
