#include "turbo/execution-coordinator.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "turbo/execution-lock.hpp"
#include "turbo/handler-entry.hpp"
#include "turbo/http-error.hpp"
#include "turbo/http-method.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/log.hpp"
#include "turbo/param-binder.hpp"
#include "turbo/path-param-capture.hpp"
#include "turbo/pending-execution.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/request-context.hpp"
#include "turbo/request-task.hpp"
#include "turbo/response-normalizer.hpp"
#include "turbo/router.hpp"
#include "turbo/scheduler.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

namespace {

constexpr std::string_view kInternalErrorMessage = "Internal server error";

// Each reactor thread matches with its own capture storage.
thread_local Router::MatchBuffer tMatchBuffer;

void Bump(std::atomic<uint64_t>& counter) { counter.fetch_add(1, std::memory_order_relaxed); }

// A handler coroutine ready to be submitted, or the failure that prevented its creation.
using CoroutineOrFailure = std::variant<PyRef, Failure>;

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(const HandlerRegistry& registry, ExecutionOptions options,
                                           RateLimiter* rateLimiter)
    : _registry(registry), _options(options), _rateLimiter(rateLimiter) {}

HttpResponse ExecutionCoordinator::ToResponse(const Failure& failure, const RequestContext& ctx) {
  return MakeErrorResponse(failure, ctx.method(), ctx.path());
}

ExecutionCoordinator::Dispatch ExecutionCoordinator::dispatch(RequestContext& ctx, ResumeTarget target) {
  Bump(_stats.nbDispatched);

  if (_rateLimiter != nullptr) {
    const auto clientKey = RateLimiter::ClientKey(ctx);
    if (!_rateLimiter->allow(clientKey)) {
      Bump(_stats.nbRateLimited);
      log::debug("Rate limit exceeded for client {}", clientKey);
      return MakeRateLimitedResponse(static_cast<uint32_t>(RateLimiter::kWindow.count()));
    }
  }

  const Router::MatchResult match = _registry.router().match(ctx.method(), ctx.path(), tMatchBuffer);
  switch (match.status) {
    case Router::MatchResult::Status::NotFound:
      Bump(_stats.nbNotFound);
      log::debug("No route for {} {}", http::MethodToStr(ctx.method()), ctx.path());
      return ToResponse(MakeFailure(ErrorKind::RouteNotFound, "Route not found"), ctx);
    case Router::MatchResult::Status::MethodNotAllowed:
      Bump(_stats.nbMethodNotAllowed);
      return MakeMethodNotAllowedResponse(match.allowedMethods, ctx.method(), ctx.path());
    case Router::MatchResult::Status::Found:
      break;
  }

  ctx.clearPathParams();
  for (const PathParamCapture& capture : match.pathParams) {
    ctx.addPathParam(capture.key, capture.value);
  }

  const HandlerEntry& entry = _registry.entry(match.routeId);
  log::trace("{} {} -> {}", http::MethodToStr(ctx.method()), ctx.path(), entry.name);
  if (entry.isAsync()) {
    Bump(_stats.nbAsync);
    return executeAsync(entry, ctx, target);
  }

  Bump(_stats.nbSync);
  Outcome outcome = executeSync(entry, ctx);
  if (auto* failure = std::get_if<Failure>(&outcome)) {
    return ToResponse(*failure, ctx);
  }
  return std::get<HttpResponse>(std::move(outcome));
}

Outcome ExecutionCoordinator::executeSync(const HandlerEntry& entry, const RequestContext& ctx) {
  ExecutionLock lock;
  try {
    BindResult bound = BindArguments(entry, ctx);
    if (!bound.ok()) {
      Bump(_stats.nbValidationErrors);
      return MakeFailure(ErrorKind::ValidationError, "Request validation failed", FieldErrorsToJson(bound.errors));
    }
    PyRef args = PyRef::Steal(PyTuple_New(0));
    if (!args) {
      return handlerFailure(entry, FetchPythonError());
    }
    PyRef result = PyRef::Steal(PyObject_Call(entry.callable.get(), args.get(), bound.kwargs.get()));
    if (!result) {
      return handlerFailure(entry, FetchPythonError());
    }
    NormalizeResult normalized = NormalizeResponse(result.get());
    if (auto* error = std::get_if<PythonError>(&normalized)) {
      return handlerFailure(entry, *error);
    }
    return std::get<HttpResponse>(std::move(normalized));
  } catch (const PythonException& ex) {
    return handlerFailure(entry, ex.error());
  }
}

RequestTask<HttpResponse> ExecutionCoordinator::executeAsync(const HandlerEntry& entry, const RequestContext& ctx,
                                                             ResumeTarget target) {
  // Coroutine object construction only, under the lock.
  CoroutineOrFailure created = [this, &entry, &ctx]() -> CoroutineOrFailure {
    ExecutionLock lock;
    try {
      BindResult bound = BindArguments(entry, ctx);
      if (!bound.ok()) {
        Bump(_stats.nbValidationErrors);
        return MakeFailure(ErrorKind::ValidationError, "Request validation failed", FieldErrorsToJson(bound.errors));
      }
      PyRef args = PyRef::Steal(PyTuple_New(0));
      PyRef coroutine = args ? PyRef::Steal(PyObject_Call(entry.callable.get(), args.get(), bound.kwargs.get()))
                             : PyRef();
      if (!coroutine) {
        return handlerFailure(entry, FetchPythonError());
      }
      return coroutine;
    } catch (const PythonException& ex) {
      return handlerFailure(entry, ex.error());
    }
  }();

  if (auto* failure = std::get_if<Failure>(&created)) {
    co_return ToResponse(*failure, ctx);
  }

  SteadyTimePoint deadline = SteadyTimePoint::max();
  if (_options.handlerTimeout.count() != 0) {
    deadline = std::chrono::steady_clock::now() + _options.handlerTimeout;
  }

  // The execution lock is not held here: the coroutine runs on the scheduler thread meanwhile.
  ExecutionResult result =
      co_await Scheduler::Instance().submit(std::get<PyRef>(std::move(created)), target, deadline);

  switch (result.status) {
    case ExecutionResult::Status::Completed: {
      NormalizeResult normalized = NormalizeResponse(result.value.get());
      if (auto* error = std::get_if<PythonError>(&normalized)) {
        co_return ToResponse(handlerFailure(entry, *error), ctx);
      }
      co_return std::get<HttpResponse>(std::move(normalized));
    }
    case ExecutionResult::Status::Raised:
      co_return ToResponse(handlerFailure(entry, result.error), ctx);
    case ExecutionResult::Status::TimedOut: {
      Bump(_stats.nbTimedOut);
      log::warn("Handler {} timed out after {} ms", entry.name, _options.handlerTimeout.count());
      Failure failure = MakeFailure(ErrorKind::TimedOut, fmt::format("Handler did not complete within {} ms",
                                                                      _options.handlerTimeout.count()));
      failure.status = _options.timeoutStatus;
      co_return ToResponse(failure, ctx);
    }
    case ExecutionResult::Status::Unavailable:
      break;
  }
  Bump(_stats.nbUnavailable);
  log::error("Async execution unavailable for handler {}", entry.name);
  co_return ToResponse(MakeFailure(ErrorKind::BridgeUnavailable, "Async execution is unavailable"), ctx);
}

Failure ExecutionCoordinator::handlerFailure(const HandlerEntry& entry, const PythonError& error) {
  Bump(_stats.nbHandlerErrors);
  if (error.statusCode) {
    log::debug("Handler {} raised {} with status {}", entry.name, error.typeName, *error.statusCode);
    std::string message = error.detail ? *error.detail : std::string(http::ReasonPhrase(*error.statusCode));
    Failure failure = MakeFailure(ErrorKind::HandlerException, std::move(message), error.detailJson);
    failure.status = *error.statusCode;
    return failure;
  }
  log::error("Handler {} for {} {} raised {}\n{}", entry.name, http::MethodToStr(entry.method), entry.pathPattern,
             error.summary(), error.traceback);
  return MakeFailure(ErrorKind::HandlerException, std::string(kInternalErrorMessage));
}

}  // namespace turbo
