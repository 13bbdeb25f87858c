#include "turbo/turbo-module.hpp"

#include "turbo/python-include.hpp"

#include <cstdint>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "turbo/handler-registry.hpp"
#include "turbo/http-method.hpp"
#include "turbo/log.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/version.hpp"

namespace turbo {

namespace {

HandlerRegistry gRegistry;
AppSettings gAppSettings;
std::mutex gDescriptionMutex;
std::string gServerAddress;
uint32_t gNbThreads{};

// Pure Python part of the module, executed in the module namespace at import.
constexpr const char* kModulePrelude = R"py(
class HTTPException(Exception):
    def __init__(self, status_code, detail=None):
        super().__init__(status_code, detail)
        self.status_code = status_code
        self.detail = detail

    def __str__(self):
        if self.detail is None:
            return str(self.status_code)
        return f"{self.status_code}: {self.detail}"


def route(method, path):
    def decorator(func):
        add_route(method, path, func)
        return func
    return decorator


def get(path):
    return route("GET", path)


def post(path):
    return route("POST", path)


def put(path):
    return route("PUT", path)


def delete(path):
    return route("DELETE", path)


def patch(path):
    return route("PATCH", path)
)py";

extern "C" PyObject* TurboAddRoute(PyObject* /*self*/, PyObject* args) {
  const char* methodStr{};
  Py_ssize_t methodLen{};
  const char* pathStr{};
  Py_ssize_t pathLen{};
  PyObject* handler{};
  if (PyArg_ParseTuple(args, "s#s#O:add_route", &methodStr, &methodLen, &pathStr, &pathLen, &handler) == 0) {
    return nullptr;
  }
  const std::string_view methodSv(methodStr, static_cast<std::size_t>(methodLen));
  const auto method = http::MethodFromStrIgnoreCase(methodSv);
  if (!method) {
    PyErr_Format(PyExc_ValueError, "Unsupported HTTP method '%s'", methodStr);
    return nullptr;
  }
  try {
    gRegistry.add(*method, std::string_view(pathStr, static_cast<std::size_t>(pathLen)), handler);
  } catch (const std::invalid_argument& ex) {
    PyErr_SetString(PyExc_ValueError, ex.what());
    return nullptr;
  } catch (const std::exception& ex) {
    // frozen registry (std::logic_error) or failed introspection (PythonException)
    PyErr_SetString(PyExc_RuntimeError, ex.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

extern "C" PyObject* TurboConfigureRateLimiting(PyObject* /*self*/, PyObject* args, PyObject* kwargs) {
  static const char* kKeywords[] = {"enabled", "requests_per_minute", nullptr};
  int enabled{};
  PyObject* rpm = Py_None;
  if (PyArg_ParseTupleAndKeywords(args, kwargs, "p|O:configure_rate_limiting", const_cast<char**>(kKeywords),
                                  &enabled, &rpm) == 0) {
    return nullptr;
  }
  uint32_t requestsPerMinute = AppSettings::kDefaultRequestsPerMinute;
  if (rpm != Py_None) {
    if (PyLong_Check(rpm) == 0 || PyBool_Check(rpm) != 0) {
      PyErr_SetString(PyExc_TypeError, "requests_per_minute must be an int or None");
      return nullptr;
    }
    const long long value = PyLong_AsLongLong(rpm);
    if (value == -1 && PyErr_Occurred() != nullptr) {
      return nullptr;
    }
    if (value <= 0 || value > std::numeric_limits<uint32_t>::max()) {
      PyErr_SetString(PyExc_ValueError, "requests_per_minute must be a positive 32 bits integer");
      return nullptr;
    }
    requestsPerMinute = static_cast<uint32_t>(value);
  }
  gAppSettings.rateLimitConfigured = true;
  gAppSettings.rateLimitEnabled = enabled != 0;
  gAppSettings.requestsPerMinute = requestsPerMinute;
  log::info("Rate limiting {} ({} requests per minute)", gAppSettings.rateLimitEnabled ? "enabled" : "disabled",
            requestsPerMinute);
  Py_RETURN_NONE;
}

extern "C" PyObject* TurboInfo(PyObject* /*self*/, PyObject* /*args*/) {
  const std::string description = ServerDescription();
  return PyUnicode_FromStringAndSize(description.data(), static_cast<Py_ssize_t>(description.size()));
}

PyMethodDef gTurboMethods[] = {
    {"add_route", TurboAddRoute, METH_VARARGS, "add_route(method, path, handler): registers a handler."},
    {"configure_rate_limiting", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(TurboConfigureRateLimiting)),
     METH_VARARGS | METH_KEYWORDS, "configure_rate_limiting(enabled, requests_per_minute=None)"},
    {"info", TurboInfo, METH_NOARGS, "info(): server description."},
    {nullptr, nullptr, 0, nullptr}};

PyModuleDef gTurboModuleDef{PyModuleDef_HEAD_INIT, "turbo", "Native HTTP execution engine.", -1, gTurboMethods,
                            nullptr,           nullptr, nullptr, nullptr};

extern "C" PyObject* PyInit_turbo() {
  PyRef module = PyRef::Steal(PyModule_Create(&gTurboModuleDef));
  if (!module) {
    return nullptr;
  }
  PyObject* dict = PyModule_GetDict(module.get());
  if (PyDict_GetItemString(dict, "__builtins__") == nullptr &&
      PyDict_SetItemString(dict, "__builtins__", PyEval_GetBuiltins()) != 0) {
    return nullptr;
  }
  if (PyModule_AddStringConstant(module.get(), "__version__", TURBO_VERSION_STR) != 0) {
    return nullptr;
  }
  PyRef res = PyRef::Steal(PyRun_String(kModulePrelude, Py_file_input, dict, dict));
  if (!res) {
    return nullptr;
  }
  return module.release();
}

}  // namespace

void RegisterTurboModule() {
  if (PyImport_AppendInittab("turbo", &PyInit_turbo) != 0) {
    throw std::runtime_error("Unable to register the turbo builtin module");
  }
}

HandlerRegistry& DefaultRegistry() { return gRegistry; }

AppSettings& DefaultAppSettings() { return gAppSettings; }

void SetServerDescription(std::string address, uint32_t nbThreads) {
  std::lock_guard<std::mutex> lock(gDescriptionMutex);
  gServerAddress = std::move(address);
  gNbThreads = nbThreads;
}

std::string ServerDescription() {
  std::string ret("turbo ");
  ret.append(version());
  {
    std::lock_guard<std::mutex> lock(gDescriptionMutex);
    if (gServerAddress.empty()) {
      ret.append(" (not started)");
    } else {
      ret.append(" running on ").append(gServerAddress);
      ret.append("\n  worker threads: ").append(std::to_string(gNbThreads));
    }
  }
  ret.append("\n  routes: ").append(std::to_string(gRegistry.size()));
  ret.append(" (").append(std::to_string(gRegistry.nbAsync())).append(" async)");
  ret.append("\n  rate limiting: ");
  if (gAppSettings.rateLimitEnabled) {
    ret.append(std::to_string(gAppSettings.requestsPerMinute)).append(" requests per minute");
  } else {
    ret.append("disabled");
  }
  ret.append("\n  python: ").append(Py_GetVersion());
  return ret;
}

}  // namespace turbo
