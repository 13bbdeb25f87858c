#include "turbo/python-runtime.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbo/execution-lock.hpp"
#include "turbo/log.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"
#include "turbo/scheduler.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo {

namespace {

std::atomic<bool> gRuntimeCreated{false};
std::atomic<bool> gRuntimeActive{false};

void CheckStatus(const PyStatus& status, PyConfig& config) {
  if (PyStatus_Exception(status) != 0) {
    PyConfig_Clear(&config);
    throw std::runtime_error(std::string("Python initialization failed: ") +
                             (status.err_msg != nullptr ? status.err_msg : "unknown error"));
  }
}

// Requires the execution lock.
void PrependSysPath(const std::string& dir) {
  PyObject* sysPath = PySys_GetObject("path");
  if (sysPath == nullptr || PyList_Check(sysPath) == 0) {
    throw std::runtime_error("sys.path is not a list");
  }
  PyRef entry = PyRef::Steal(PyUnicode_DecodeFSDefaultAndSize(dir.data(), static_cast<Py_ssize_t>(dir.size())));
  if (!entry) {
    ThrowPythonError("sys.path entry");
  }
  const int contains = PySequence_Contains(sysPath, entry.get());
  if (contains == -1) {
    ThrowPythonError("sys.path lookup");
  }
  if (contains == 0 && PyList_Insert(sysPath, 0, entry.get()) != 0) {
    ThrowPythonError("sys.path insertion");
  }
}

}  // namespace

PythonRuntime::PythonRuntime(const PythonRuntimeConfig& config) {
  if (gRuntimeCreated.exchange(true)) {
    throw std::logic_error("Only one PythonRuntime may be created per process");
  }

  RegisterTurboModule();

  PyConfig pyConfig;
  PyConfig_InitPythonConfig(&pyConfig);
  pyConfig.install_signal_handlers = 0;
  pyConfig.parse_argv = 0;
  CheckStatus(PyConfig_SetBytesString(&pyConfig, &pyConfig.program_name, config.programName.c_str()), pyConfig);
  CheckStatus(Py_InitializeFromConfig(&pyConfig), pyConfig);
  PyConfig_Clear(&pyConfig);

  try {
    for (const std::string& dir : config.sysPath) {
      PrependSysPath(dir);
    }
    PythonModules::Load();
  } catch (const std::exception& ex) {
    log::critical("Python runtime setup failed: {}", ex.what());
    PythonModules::Unload();
    Py_FinalizeEx();
    throw;
  }

  gRuntimeActive.store(true);
  log::info("Python {} initialized", Py_GetVersion());

  _mainThreadState = PyEval_SaveThread();
}

PythonRuntime::~PythonRuntime() {
  Scheduler::Shutdown();

  PyEval_RestoreThread(_mainThreadState);
  DefaultRegistry().clear();
  PythonModules::Unload();
  gRuntimeActive.store(false);
  if (Py_FinalizeEx() != 0) {
    log::error("Errors occurred while finalizing the Python interpreter");
  } else {
    log::info("Python interpreter finalized");
  }
}

bool PythonRuntime::IsActive() noexcept { return gRuntimeActive.load(std::memory_order_acquire); }

PyRef PythonRuntime::runString(std::string_view code, std::string_view filename) const {
  ExecutionLock lock;

  PyRef globals = PyRef::Steal(PyDict_New());
  if (!globals || PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) != 0) {
    ThrowPythonError("namespace creation");
  }
  PyRef name = PyRef::Steal(PyUnicode_FromString("__turbo_app__"));
  if (!name || PyDict_SetItemString(globals.get(), "__name__", name.get()) != 0) {
    ThrowPythonError("namespace creation");
  }

  const std::string codeStr(code);
  const std::string filenameStr(filename);
  PyRef compiled = PyRef::Steal(Py_CompileString(codeStr.c_str(), filenameStr.c_str(), Py_file_input));
  if (!compiled) {
    ThrowPythonError(filenameStr);
  }
  PyRef result = PyRef::Steal(PyEval_EvalCode(compiled.get(), globals.get(), globals.get()));
  if (!result) {
    ThrowPythonError(filenameStr);
  }
  return globals;
}

PyRef PythonRuntime::runFile(const std::string& path) const {
  const std::filesystem::path filePath = std::filesystem::absolute(path);
  if (!std::filesystem::is_regular_file(filePath)) {
    throw std::invalid_argument("Application file not found: " + path);
  }

  ExecutionLock lock;
  PrependSysPath(filePath.parent_path().string());

  PyRef runpy = PyRef::Steal(PyImport_ImportModule("runpy"));
  PyRef runPath = runpy ? PyRef::Steal(PyObject_GetAttrString(runpy.get(), "run_path")) : PyRef();
  if (!runPath) {
    ThrowPythonError("runpy");
  }
  PyRef args = PyRef::Steal(Py_BuildValue("(s)", filePath.c_str()));
  PyRef kwargs = PyRef::Steal(Py_BuildValue("{s:s}", "run_name", "__turbo_app__"));
  if (!args || !kwargs) {
    ThrowPythonError("runpy arguments");
  }
  PyRef result = PyRef::Steal(PyObject_Call(runPath.get(), args.get(), kwargs.get()));
  if (!result) {
    ThrowPythonError(path);
  }
  log::info("Loaded application {}", filePath.string());
  return result;
}

}  // namespace turbo
