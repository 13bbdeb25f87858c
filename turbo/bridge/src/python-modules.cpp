#include "turbo/python-modules.hpp"

#include <memory>
#include <stdexcept>

#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"

namespace turbo {

namespace {

constexpr const char* kSupportCode = R"py(
import asyncio

def close_loop(loop):
    try:
        tasks = [task for task in asyncio.all_tasks(loop) if not task.done()]
        for task in tasks:
            task.cancel()
        if tasks:
            loop.run_until_complete(asyncio.gather(*tasks, return_exceptions=True))
        loop.run_until_complete(loop.shutdown_asyncgens())
    finally:
        loop.close()
)py";

std::unique_ptr<PythonModules> gModules;

PyRef ImportModule(const char* name) {
  PyRef module = PyRef::Steal(PyImport_ImportModule(name));
  if (!module) {
    ThrowPythonError(name);
  }
  return module;
}

PyRef GetAttr(const PyRef& obj, const char* name) {
  PyRef attr = PyRef::Steal(PyObject_GetAttrString(obj.get(), name));
  if (!attr) {
    ThrowPythonError(name);
  }
  return attr;
}

PyRef LoadSupportFunction(const char* name) {
  PyRef globals = PyRef::Steal(PyDict_New());
  if (!globals || PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) != 0) {
    ThrowPythonError("support module");
  }
  PyRef result = PyRef::Steal(PyRun_String(kSupportCode, Py_file_input, globals.get(), globals.get()));
  if (!result) {
    ThrowPythonError("support module");
  }
  PyObject* func = PyDict_GetItemString(globals.get(), name);
  if (func == nullptr) {
    throw std::logic_error("support function not defined");
  }
  return PyRef::Borrow(func);
}

}  // namespace

void PythonModules::Load() {
  auto modules = std::make_unique<PythonModules>();

  PyRef json = ImportModule("json");
  modules->jsonDumps = GetAttr(json, "dumps");
  modules->jsonLoads = GetAttr(json, "loads");

  PyRef asyncio = ImportModule("asyncio");
  modules->newEventLoop = GetAttr(asyncio, "new_event_loop");
  modules->setEventLoop = GetAttr(asyncio, "set_event_loop");
  modules->runCoroutineThreadsafe = GetAttr(asyncio, "run_coroutine_threadsafe");

  PyRef inspect = ImportModule("inspect");
  modules->isCoroutineFunction = GetAttr(inspect, "iscoroutinefunction");
  modules->signature = GetAttr(inspect, "signature");
  PyRef parameter = GetAttr(inspect, "Parameter");
  modules->parameterEmpty = GetAttr(parameter, "empty");

  PyRef traceback = ImportModule("traceback");
  modules->formatException = GetAttr(traceback, "format_exception");

  modules->closeLoop = LoadSupportFunction("close_loop");

  gModules = std::move(modules);
}

void PythonModules::Unload() noexcept { gModules.reset(); }

const PythonModules* PythonModules::IfLoaded() noexcept { return gModules.get(); }

const PythonModules& PythonModules::Get() {
  if (!gModules) {
    throw std::logic_error("Python runtime is not initialized");
  }
  return *gModules;
}

}  // namespace turbo
