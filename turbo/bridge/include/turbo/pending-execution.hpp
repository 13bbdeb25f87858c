#pragma once

#include "turbo/python-include.hpp"

#include <coroutine>
#include <cstdint>
#include <memory>

#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"

namespace turbo {

struct ExecutionResult {
  enum class Status : uint8_t {
    Completed,   // 'value' holds the coroutine return value
    Raised,      // 'error' holds the exception raised by the coroutine (or by its submission)
    TimedOut,    // deadline expired, execution cancelled
    Unavailable  // scheduler not running, died or shut down
  };

  Status status{Status::Unavailable};
  PyRef value;
  PythonError error;
};

// Native awaitable for a coroutine submitted to the Scheduler.
//
// Must be awaited from a coroutine running on the reactor thread owning the ResumeTarget queue, without holding
// the execution lock: awaiting with the lock held throws std::logic_error. The lock is taken again only briefly
// in await_resume to extract the result.
// Destroying an execution that was suspended but never resumed cancels the underlying future.
class PendingExecution {
 public:
  explicit PendingExecution(std::shared_ptr<PendingState> state) noexcept : _state(std::move(state)) {}

  PendingExecution(const PendingExecution&) = delete;
  PendingExecution& operator=(const PendingExecution&) = delete;

  PendingExecution(PendingExecution&&) noexcept = default;
  PendingExecution& operator=(PendingExecution&& other) noexcept;

  ~PendingExecution() { abandon(); }

  [[nodiscard]] bool await_ready() const noexcept { return _state->completion != PendingCompletion::Pending; }

  void await_suspend(std::coroutine_handle<> handle);

  ExecutionResult await_resume();

  [[nodiscard]] PendingCompletion completion() const noexcept { return _state->completion; }

 private:
  void abandon() noexcept;

  std::shared_ptr<PendingState> _state;
};

}  // namespace turbo
