#pragma once

#include "turbo/python-include.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "turbo/pending-state.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

// Per reactor queue of suspended async executions.
//
// The reactor registers fd() in its event loop. When readable, drain() resumes the coroutines whose
// futures completed. expire() is called periodically to time out executions past their deadline and to fail
// those still waiting on a scheduler that died. Coroutines are always resumed on the reactor thread.
class ResumeQueue {
 public:
  ResumeQueue();

  ResumeQueue(const ResumeQueue&) = delete;
  ResumeQueue(ResumeQueue&&) = delete;
  ResumeQueue& operator=(const ResumeQueue&) = delete;
  ResumeQueue& operator=(ResumeQueue&&) = delete;

  ~ResumeQueue();

  [[nodiscard]] int fd() const noexcept { return _inbox->fd(); }

  [[nodiscard]] std::weak_ptr<ResumeInbox> inbox() const noexcept { return _inbox; }

  // Starts tracking a suspended execution.
  void track(std::shared_ptr<PendingState> state);

  // Resumes the executions whose future completed, then calls onResumed(tag) for each of them.
  // Returns the number of resumed executions.
  template <class OnResumed>
  std::size_t drain(OnResumed&& onResumed) {
    return resumeAll(collectCompleted(), onResumed);
  }

  // Times out tracked executions whose deadline is before 'now' (their future is cancelled), and fails all of
  // them if the scheduler is no longer available. Resumed executions are reported to onResumed(tag).
  template <class OnResumed>
  std::size_t expire(SteadyTimePoint now, OnResumed&& onResumed) {
    return resumeAll(collectExpired(now), onResumed);
  }

  // Number of tracked executions not resumed yet.
  [[nodiscard]] std::size_t nbPending() const noexcept {
    return static_cast<std::size_t>(std::ranges::count_if(_pending, [](const auto& state) { return !state->resumed; }));
  }

  // Blocks until fd() is readable or 'timeout' elapsed. Returns true if readable.
  [[nodiscard]] bool wait(std::chrono::milliseconds timeout) const;

 private:
  using States = std::vector<std::shared_ptr<PendingState>>;

  template <class OnResumed>
  static std::size_t resumeAll(const States& states, OnResumed& onResumed) {
    for (const auto& state : states) {
      state->handle.resume();
      onResumed(state->tag);
    }
    return states.size();
  }

  States collectCompleted();

  States collectExpired(SteadyTimePoint now);

  void untrackResumed();

  std::shared_ptr<ResumeInbox> _inbox;
  States _pending;
};

}  // namespace turbo
