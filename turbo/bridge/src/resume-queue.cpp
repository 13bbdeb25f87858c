#include "turbo/resume-queue.hpp"

#include <poll.h>

#include <cerrno>
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "turbo/execution-lock.hpp"
#include "turbo/log.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/scheduler.hpp"

namespace turbo {

void ResumeInbox::post(std::shared_ptr<PendingState> state) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _ready.push_back(std::move(state));
  }
  _eventFd.send();
}

std::vector<std::shared_ptr<PendingState>> ResumeInbox::takeAll() {
  std::vector<std::shared_ptr<PendingState>> ready;
  std::lock_guard<std::mutex> lock(_mutex);
  ready.swap(_ready);
  return ready;
}

ResumeQueue::ResumeQueue() : _inbox(std::make_shared<ResumeInbox>()) {}

ResumeQueue::~ResumeQueue() {
  for (const auto& state : _pending) {
    if (!state->resumed) {
      state->resumed = true;
      state->completion = PendingCompletion::Abandoned;
      state->future.reset();
    }
  }
}

void ResumeQueue::track(std::shared_ptr<PendingState> state) { _pending.push_back(std::move(state)); }

ResumeQueue::States ResumeQueue::collectCompleted() {
  _inbox->consumeWakeups();

  States completed;
  for (auto& state : _inbox->takeAll()) {
    if (state->resumed) {
      // already timed out or abandoned
      continue;
    }
    if (state->completion == PendingCompletion::Pending) {
      state->completion = PendingCompletion::Done;
    }
    if (!state->handle) {
      // completed before being awaited, it will not suspend
      continue;
    }
    state->resumed = true;
    completed.push_back(std::move(state));
  }
  untrackResumed();
  return completed;
}

ResumeQueue::States ResumeQueue::collectExpired(SteadyTimePoint now) {
  const Scheduler* scheduler = Scheduler::IfCreated();
  const bool schedulerLost = scheduler != nullptr && !scheduler->available();

  States expired;
  for (const auto& state : _pending) {
    if (state->resumed) {
      continue;
    }
    if (schedulerLost) {
      state->completion = PendingCompletion::Unavailable;
      state->future.reset();
    } else if (state->deadline <= now) {
      state->completion = PendingCompletion::TimedOut;
      ExecutionLock lock;
      PyRef res = PyRef::Steal(PyObject_CallMethod(state->future.get(), "cancel", nullptr));
      if (!res) {
        const PythonError error = FetchPythonError();
        log::warn("Unable to cancel timed out execution: {}", error.summary());
      }
      state->future.reset();
    } else {
      continue;
    }
    state->resumed = true;
    expired.push_back(state);
  }
  untrackResumed();
  return expired;
}

void ResumeQueue::untrackResumed() {
  std::erase_if(_pending, [](const auto& state) { return state->resumed; });
}

bool ResumeQueue::wait(std::chrono::milliseconds timeout) const {
  pollfd pfd{};
  pfd.fd = fd();
  pfd.events = POLLIN;
  while (true) {
    const int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    if (ret == -1) {
      log::error("poll on resume queue failed: errno {}", errno);
    }
    return ret > 0;
  }
}

}  // namespace turbo
