#pragma once

#include "turbo/python-include.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "turbo/py-ref.hpp"

namespace turbo {

struct PythonRuntimeConfig {
  // Directories prepended to sys.path.
  std::vector<std::string> sysPath;
  std::string programName{"turbo"};
};

// Owner of the embedded interpreter. At most one instance may exist in the process, for its whole lifetime:
// CPython does not support reinitialization reliably.
//
// The constructor registers the builtin 'turbo' module, initializes the interpreter (without Python signal
// handlers, signals stay owned by the server), loads the cached modules and releases the execution lock.
// The destructor tears down the scheduler, releases registered handlers and finalizes the interpreter.
class PythonRuntime {
 public:
  explicit PythonRuntime(const PythonRuntimeConfig& config = {});

  PythonRuntime(const PythonRuntime&) = delete;
  PythonRuntime(PythonRuntime&&) = delete;
  PythonRuntime& operator=(const PythonRuntime&) = delete;
  PythonRuntime& operator=(PythonRuntime&&) = delete;

  ~PythonRuntime();

  [[nodiscard]] static bool IsActive() noexcept;

  // Executes 'code' as a module body in a fresh namespace and returns that namespace (a dict).
  // Takes the execution lock, throws PythonException on error.
  PyRef runString(std::string_view code, std::string_view filename = "<string>") const;

  // Executes the Python file at 'path' with runpy under the module name '__turbo_app__'.
  // Its directory is added to sys.path first. Takes the execution lock, throws PythonException on error.
  PyRef runFile(const std::string& path) const;

  [[nodiscard]] std::string_view version() const noexcept { return Py_GetVersion(); }

 private:
  PyThreadState* _mainThreadState{};
};

}  // namespace turbo
