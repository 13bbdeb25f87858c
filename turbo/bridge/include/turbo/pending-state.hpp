#pragma once

#include "turbo/python-include.hpp"

#include <coroutine>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "turbo/event-fd.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

class ResumeQueue;

// Identifies where (reactor resume queue) and for whom (opaque tag) an execution must be resumed.
struct ResumeTarget {
  ResumeQueue* queue{};
  uint64_t tag{};
};

enum class PendingCompletion : uint8_t {
  Pending,       // submitted, future not resolved yet
  Done,          // future resolved (result, exception or external cancellation)
  TimedOut,      // deadline expired, future cancelled
  Unavailable,   // the scheduler was not running or died
  SubmitFailed,  // the submission itself raised
  Abandoned      // the awaiting coroutine was destroyed before resumption
};

struct PendingState;

// Thread safe mailbox of completed executions, fed by future done callbacks running on the scheduler thread.
// Posting wakes the owning reactor through an eventfd.
class ResumeInbox {
 public:
  ResumeInbox() = default;

  void post(std::shared_ptr<PendingState> state);

  [[nodiscard]] std::vector<std::shared_ptr<PendingState>> takeAll();

  [[nodiscard]] int fd() const noexcept { return _eventFd.fd(); }

  void consumeWakeups() const noexcept { _eventFd.read(); }

 private:
  std::mutex _mutex;
  std::vector<std::shared_ptr<PendingState>> _ready;
  EventFd _eventFd;
};

// Shared state of one in-flight async execution.
// All fields are only touched by the reactor thread owning 'queue', except that the done callback posts the
// state to 'inbox' from the scheduler thread. 'future' is only used with the execution lock held.
struct PendingState {
  PyRef future;
  std::coroutine_handle<> handle;
  ResumeQueue* queue{};
  uint64_t tag{};
  SteadyTimePoint deadline{SteadyTimePoint::max()};
  std::weak_ptr<ResumeInbox> inbox;
  PendingCompletion completion{PendingCompletion::Pending};
  bool resumed{false};
  PythonError submitError;
};

}  // namespace turbo
