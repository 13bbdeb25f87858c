#pragma once

#include "turbo/python-include.hpp"

#include "turbo/py-ref.hpp"

namespace turbo {

// Python callables used on the request path, resolved once when the interpreter starts so that no import
// happens (and no import lock is taken) while serving.
struct PythonModules {
  PyRef jsonDumps;
  PyRef jsonLoads;
  PyRef newEventLoop;
  PyRef setEventLoop;
  PyRef runCoroutineThreadsafe;
  PyRef isCoroutineFunction;
  PyRef signature;
  PyRef parameterEmpty;
  PyRef formatException;
  // close_loop(loop): cancels remaining tasks, finalizes async generators and closes the loop.
  PyRef closeLoop;

  // Loads the modules. Requires the execution lock, throws PythonException on failure.
  static void Load();

  // Releases the references. Requires the execution lock.
  static void Unload() noexcept;

  [[nodiscard]] static const PythonModules* IfLoaded() noexcept;

  // Throws std::logic_error if the interpreter is not running.
  [[nodiscard]] static const PythonModules& Get();
};

}  // namespace turbo
