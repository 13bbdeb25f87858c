#pragma once

#include "turbo/python-include.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

#include "turbo/pending-execution.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

// The single persistent cooperative scheduler: one asyncio event loop running forever on one dedicated thread.
//
// It is created lazily by the first Instance() call behind a once-guard, is never recreated nor sharded, and is
// torn down by Shutdown() (called by the PythonRuntime destructor). Coroutines are submitted from any thread
// with asyncio.run_coroutine_threadsafe and run inline on the loop. Their completion is posted to the resume
// queue of the submitter.
//
// If the loop thread dies (an exception escaping run_forever, such as SystemExit raised by a handler) the
// scheduler becomes Failed: new submissions and all in-flight executions resolve as unavailable.
class Scheduler {
 public:
  enum class State : uint8_t { Running, Stopped, Failed };

  Scheduler(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  ~Scheduler();

  // Returns the scheduler, creating it on first call. Thread safe.
  // After Shutdown(), returns a stopped scheduler.
  static Scheduler& Instance();

  // Returns the scheduler if it has been created, nullptr otherwise.
  [[nodiscard]] static Scheduler* IfCreated() noexcept;

  // Stops the loop, joins its thread, cancels remaining tasks and closes the loop. Idempotent.
  // Must not be called from the scheduler thread.
  static void Shutdown();

  // Number of event loops created since the start of the process.
  [[nodiscard]] static uint32_t CreatedCount() noexcept;

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  [[nodiscard]] bool available() const noexcept { return state() == State::Running; }

  [[nodiscard]] uint64_t nbSubmissions() const noexcept { return _nbSubmissions.load(std::memory_order_relaxed); }

  [[nodiscard]] std::thread::id threadId() const noexcept { return _thread.get_id(); }

  // Schedules 'coroutine' on the loop and returns the awaitable execution, resumed on target.queue.
  // Callable concurrently from any thread, takes the execution lock for the duration of the submission.
  // If the scheduler is not available the coroutine is closed and the execution resolves as unavailable
  // without suspending.
  [[nodiscard]] PendingExecution submit(PyRef coroutine, ResumeTarget target,
                                        SteadyTimePoint deadline = SteadyTimePoint::max());

 private:
  Scheduler();

  static void CreateInstance();

  void run();

  void stop();

  PyRef _loop;
  std::thread _thread;
  std::atomic<State> _state{State::Stopped};
  std::atomic<uint64_t> _nbSubmissions{0};
};

}  // namespace turbo
