#include "turbo/python-test-env.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbo/execution-lock.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-runtime.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo::test {

namespace {
PythonRuntime* gRuntime{};
}  // namespace

void PythonTestEnvironment::SetUp() {
  _runtime = std::make_unique<PythonRuntime>();
  gRuntime = _runtime.get();
}

void PythonTestEnvironment::TearDown() {
  gRuntime = nullptr;
  _runtime.reset();
}

PythonRuntime& PythonTestEnvironment::Runtime() {
  if (gRuntime == nullptr) {
    throw std::logic_error("PythonTestEnvironment is not set up");
  }
  return *gRuntime;
}

PyRef RunPython(std::string_view code) { return PythonTestEnvironment::Runtime().runString(code, "<test>"); }

PyRef GetGlobal(const PyRef& globals, const char* name) {
  ExecutionLock lock;
  PyObject* value = PyDict_GetItemString(globals.get(), name);
  if (value == nullptr) {
    throw std::invalid_argument(std::string("No global named ") + name);
  }
  return PyRef::Borrow(value);
}

void ResetTurboModule() {
  ExecutionLock lock;
  DefaultRegistry().clear();
  DefaultAppSettings() = AppSettings{};
}

}  // namespace turbo::test
