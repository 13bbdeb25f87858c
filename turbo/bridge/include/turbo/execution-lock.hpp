#pragma once

#include "turbo/python-include.hpp"

namespace turbo {

// Scoped ownership of the interpreter execution lock (the GIL) for the calling thread.
// Re-entrant: acquiring it on a thread already holding it is allowed.
// On free-threaded builds it only attaches a thread state and provides no mutual exclusion.
class ExecutionLock {
 public:
  ExecutionLock() noexcept : _state(PyGILState_Ensure()) {}

  ExecutionLock(const ExecutionLock&) = delete;
  ExecutionLock(ExecutionLock&&) = delete;
  ExecutionLock& operator=(const ExecutionLock&) = delete;
  ExecutionLock& operator=(ExecutionLock&&) = delete;

  ~ExecutionLock() { PyGILState_Release(_state); }

  [[nodiscard]] static bool HeldByThisThread() noexcept { return PyGILState_Check() == 1; }

  // Whether holding the lock excludes other threads from running managed code.
  [[nodiscard]] static constexpr bool IsExclusive() noexcept {
#ifdef Py_GIL_DISABLED
    return false;
#else
    return true;
#endif
  }

 private:
  PyGILState_STATE _state;
};

// Scoped release of the execution lock held by the calling thread, for blocking native operations.
class ExecutionUnlock {
 public:
  ExecutionUnlock() noexcept : _threadState(PyEval_SaveThread()) {}

  ExecutionUnlock(const ExecutionUnlock&) = delete;
  ExecutionUnlock(ExecutionUnlock&&) = delete;
  ExecutionUnlock& operator=(const ExecutionUnlock&) = delete;
  ExecutionUnlock& operator=(ExecutionUnlock&&) = delete;

  ~ExecutionUnlock() { PyEval_RestoreThread(_threadState); }

 private:
  PyThreadState* _threadState;
};

}  // namespace turbo
