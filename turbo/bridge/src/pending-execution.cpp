#include "turbo/pending-execution.hpp"

#include <coroutine>
#include <stdexcept>
#include <utility>

#include "turbo/execution-lock.hpp"
#include "turbo/log.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/resume-queue.hpp"
#include "turbo/scheduler.hpp"

namespace turbo {

PendingExecution& PendingExecution::operator=(PendingExecution&& other) noexcept {
  if (this != &other) {
    abandon();
    _state = std::move(other._state);
  }
  return *this;
}

void PendingExecution::await_suspend(std::coroutine_handle<> handle) {
  if (ExecutionLock::IsExclusive() && ExecutionLock::HeldByThisThread()) {
    throw std::logic_error("PendingExecution awaited while holding the execution lock");
  }
  if (_state->queue == nullptr) {
    throw std::logic_error("PendingExecution awaited without a resume queue");
  }
  _state->handle = handle;
  _state->queue->track(_state);
}

ExecutionResult PendingExecution::await_resume() {
  _state->resumed = true;

  ExecutionResult result;
  switch (_state->completion) {
    case PendingCompletion::TimedOut:
      result.status = ExecutionResult::Status::TimedOut;
      break;
    case PendingCompletion::SubmitFailed:
      result.status = ExecutionResult::Status::Raised;
      result.error = std::move(_state->submitError);
      break;
    case PendingCompletion::Done: {
      ExecutionLock lock;
      PyRef cancelled = PyRef::Steal(PyObject_CallMethod(_state->future.get(), "cancelled", nullptr));
      const Scheduler* scheduler = Scheduler::IfCreated();
      if (cancelled && PyObject_IsTrue(cancelled.get()) == 1 && (scheduler == nullptr || !scheduler->available())) {
        // cancelled by the scheduler teardown
        result.status = ExecutionResult::Status::Unavailable;
      } else if (!cancelled) {
        result.status = ExecutionResult::Status::Raised;
        result.error = FetchPythonError();
      } else {
        result.value = PyRef::Steal(PyObject_CallMethod(_state->future.get(), "result", nullptr));
        if (result.value) {
          result.status = ExecutionResult::Status::Completed;
        } else {
          result.status = ExecutionResult::Status::Raised;
          result.error = FetchPythonError();
        }
      }
      break;
    }
    default:
      result.status = ExecutionResult::Status::Unavailable;
      break;
  }
  // breaks the future -> done callback -> state reference cycle
  _state->future.reset();
  return result;
}

void PendingExecution::abandon() noexcept {
  if (!_state || _state->resumed) {
    return;
  }
  _state->resumed = true;
  _state->completion = PendingCompletion::Abandoned;
  if (_state->future) {
    ExecutionLock lock;
    PyRef res = PyRef::Steal(PyObject_CallMethod(_state->future.get(), "cancel", nullptr));
    if (!res) {
      const PythonError error = FetchPythonError();
      log::warn("Unable to cancel abandoned execution: {}", error.summary());
    }
    _state->future.reset();
  }
}

}  // namespace turbo
