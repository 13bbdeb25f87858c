#include "turbo/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "turbo/execution-lock.hpp"
#include "turbo/log.hpp"
#include "turbo/pending-execution.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"
#include "turbo/python-runtime.hpp"
#include "turbo/resume-queue.hpp"

namespace turbo {

namespace {

constexpr const char* kCapsuleName = "turbo.pending_state";

std::once_flag gCreateOnce;
std::unique_ptr<Scheduler> gScheduler;
std::atomic<Scheduler*> gSchedulerPtr{nullptr};
std::atomic<uint32_t> gCreatedCount{0};
std::atomic<bool> gShutdownRequested{false};

using StatePtr = std::shared_ptr<PendingState>;

// Done callback of the submitted futures. Runs on the scheduler thread (or on the thread cancelling the future),
// with the execution lock held. 'self' is the capsule holding the execution state.
extern "C" PyObject* TurboFutureDone(PyObject* self, [[maybe_unused]] PyObject* future) {
  auto* state = static_cast<StatePtr*>(PyCapsule_GetPointer(self, kCapsuleName));
  if (state == nullptr) {
    return nullptr;
  }
  std::shared_ptr<ResumeInbox> inbox = (*state)->inbox.lock();
  if (inbox) {
    try {
      inbox->post(*state);
    } catch (const std::exception& ex) {
      PyErr_SetString(PyExc_RuntimeError, ex.what());
      return nullptr;
    }
  }
  Py_RETURN_NONE;
}

extern "C" void TurboDestroyStateCapsule(PyObject* capsule) {
  auto* state = static_cast<StatePtr*>(PyCapsule_GetPointer(capsule, kCapsuleName));
  if (state == nullptr) {
    PyErr_Clear();
    return;
  }
  delete state;
}

PyMethodDef gDoneCallbackDef{"turbo_future_done", TurboFutureDone, METH_O, nullptr};

// Requires the execution lock.
void CloseCoroutine(const PyRef& coroutine) {
  if (!coroutine) {
    return;
  }
  PyRef res = PyRef::Steal(PyObject_CallMethod(coroutine.get(), "close", nullptr));
  if (!res) {
    const PythonError error = FetchPythonError();
    log::debug("Unable to close coroutine: {}", error.summary());
  }
}

}  // namespace

void Scheduler::CreateInstance() {
  std::call_once(gCreateOnce, [] {
    gScheduler = std::unique_ptr<Scheduler>(new Scheduler());
    gSchedulerPtr.store(gScheduler.get(), std::memory_order_release);
  });
}

Scheduler::Scheduler() {
  if (gShutdownRequested.load() || !PythonRuntime::IsActive()) {
    log::warn("Scheduler requested while the Python runtime is not running");
    return;
  }

  ExecutionLock lock;
  const PythonModules& modules = PythonModules::Get();
  _loop = PyRef::Steal(PyObject_CallNoArgs(modules.newEventLoop.get()));
  if (!_loop) {
    const PythonError error = FetchPythonError();
    log::critical("Unable to create the scheduler event loop: {}", error.summary());
    _state.store(State::Failed);
    return;
  }
  gCreatedCount.fetch_add(1);
  _state.store(State::Running);
  _thread = std::thread(&Scheduler::run, this);
  log::info("Scheduler started");
}

Scheduler::~Scheduler() {
  if (_thread.joinable()) {
    // Not shut down before process exit, the interpreter may already be gone.
    _thread.detach();
  }
}

Scheduler& Scheduler::Instance() {
  Scheduler* scheduler = gSchedulerPtr.load(std::memory_order_acquire);
  if (scheduler != nullptr) {
    return *scheduler;
  }
  if (PythonRuntime::IsActive() && ExecutionLock::HeldByThisThread()) {
    // creation needs the lock on this thread and the once-guard may be held by another thread waiting for it
    ExecutionUnlock unlock;
    CreateInstance();
  } else {
    CreateInstance();
  }
  return *gSchedulerPtr.load(std::memory_order_acquire);
}

Scheduler* Scheduler::IfCreated() noexcept { return gSchedulerPtr.load(std::memory_order_acquire); }

uint32_t Scheduler::CreatedCount() noexcept { return gCreatedCount.load(); }

void Scheduler::Shutdown() {
  gShutdownRequested.store(true);
  Scheduler* scheduler = IfCreated();
  if (scheduler != nullptr) {
    scheduler->stop();
  }
}

void Scheduler::run() {
  ExecutionLock lock;

  const PythonModules* modules = PythonModules::IfLoaded();
  if (modules == nullptr) {
    _state.store(State::Failed);
    log::critical("Scheduler thread started without Python modules");
    return;
  }

  PyRef setLoop = PyRef::Steal(PyObject_CallOneArg(modules->setEventLoop.get(), _loop.get()));
  if (!setLoop) {
    const PythonError error = FetchPythonError();
    log::warn("Unable to set the scheduler event loop as current: {}", error.summary());
  }

  PyRef result = PyRef::Steal(PyObject_CallMethod(_loop.get(), "run_forever", nullptr));
  if (!result) {
    const PythonError error = FetchPythonError();
    _state.store(State::Failed);
    log::critical("Scheduler thread died with {}\n{}", error.summary(), error.traceback);
    return;
  }

  State expected = State::Running;
  if (_state.compare_exchange_strong(expected, State::Failed)) {
    log::critical("Scheduler event loop stopped unexpectedly");
  }
}

void Scheduler::stop() {
  if (!_thread.joinable() && !_loop) {
    return;
  }

  State expected = State::Running;
  if (_state.compare_exchange_strong(expected, State::Stopped)) {
    ExecutionLock lock;
    PyRef stopFn = PyRef::Steal(PyObject_GetAttrString(_loop.get(), "stop"));
    PyRef res = stopFn ? PyRef::Steal(PyObject_CallMethod(_loop.get(), "call_soon_threadsafe", "O", stopFn.get()))
                       : PyRef();
    if (!res) {
      const PythonError error = FetchPythonError();
      log::error("Unable to stop the scheduler event loop: {}", error.summary());
    }
  }

  if (_thread.joinable()) {
    if (ExecutionLock::HeldByThisThread()) {
      ExecutionUnlock unlock;
      _thread.join();
    } else {
      _thread.join();
    }
  }

  if (_loop) {
    ExecutionLock lock;
    PyRef res = PyRef::Steal(PyObject_CallOneArg(PythonModules::Get().closeLoop.get(), _loop.get()));
    if (!res) {
      const PythonError error = FetchPythonError();
      log::warn("Errors while closing the scheduler event loop: {}", error.summary());
    }
    _loop.reset();
  }
  log::info("Scheduler stopped after {} submission(s)", nbSubmissions());
}

PendingExecution Scheduler::submit(PyRef coroutine, ResumeTarget target, SteadyTimePoint deadline) {
  auto state = std::make_shared<PendingState>();
  state->queue = target.queue;
  state->tag = target.tag;
  state->deadline = deadline;
  if (target.queue != nullptr) {
    state->inbox = target.queue->inbox();
  }

  ExecutionLock lock;
  if (!available()) {
    CloseCoroutine(coroutine);
    state->completion = PendingCompletion::Unavailable;
    return PendingExecution(std::move(state));
  }

  PyRef future = PyRef::Steal(PyObject_CallFunctionObjArgs(PythonModules::Get().runCoroutineThreadsafe.get(),
                                                           coroutine.get(), _loop.get(), nullptr));
  if (!future) {
    state->submitError = FetchPythonError();
    state->completion = PendingCompletion::SubmitFailed;
    CloseCoroutine(coroutine);
    return PendingExecution(std::move(state));
  }

  auto capsuleState = std::make_unique<StatePtr>(state);
  PyRef capsule = PyRef::Steal(PyCapsule_New(capsuleState.get(), kCapsuleName, &TurboDestroyStateCapsule));
  if (capsule) {
    static_cast<void>(capsuleState.release());
  }
  PyRef callback = capsule ? PyRef::Steal(PyCFunction_New(&gDoneCallbackDef, capsule.get())) : PyRef();
  PyRef added = callback ? PyRef::Steal(PyObject_CallMethod(future.get(), "add_done_callback", "O", callback.get()))
                         : PyRef();
  if (!added) {
    state->submitError = FetchPythonError();
    state->completion = PendingCompletion::SubmitFailed;
    PyRef cancelled = PyRef::Steal(PyObject_CallMethod(future.get(), "cancel", nullptr));
    if (!cancelled) {
      PyErr_Clear();
    }
    return PendingExecution(std::move(state));
  }

  state->future = std::move(future);
  _nbSubmissions.fetch_add(1, std::memory_order_relaxed);
  return PendingExecution(std::move(state));
}

}  // namespace turbo
