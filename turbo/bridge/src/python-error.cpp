#include "turbo/python-error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "turbo/http-status-code.hpp"
#include "turbo/log.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"

namespace turbo {

namespace {

// UTF-8 contents of str(obj), or 'fallback' if it cannot be computed (the error is cleared).
std::string ObjectToString(PyObject* obj, std::string_view fallback) {
  PyRef str = PyRef::Steal(PyObject_Str(obj));
  if (str) {
    Py_ssize_t size{};
    const char* data = PyUnicode_AsUTF8AndSize(str.get(), &size);
    if (data != nullptr) {
      return {data, static_cast<std::size_t>(size)};
    }
  }
  PyErr_Clear();
  return std::string(fallback);
}

std::string FormatTraceback(PyObject* type, PyObject* value, PyObject* traceback) {
  const PythonModules* modules = PythonModules::IfLoaded();
  if (modules == nullptr || traceback == nullptr) {
    return {};
  }
  PyRef lines = PyRef::Steal(
      PyObject_CallFunctionObjArgs(modules->formatException.get(), type, value, traceback, nullptr));
  if (!lines) {
    PyErr_Clear();
    log::debug("Unable to format Python traceback");
    return {};
  }
  PyRef empty = PyRef::Steal(PyUnicode_FromString(""));
  PyRef joined = empty ? PyRef::Steal(PyUnicode_Join(empty.get(), lines.get())) : PyRef();
  if (!joined) {
    PyErr_Clear();
    return {};
  }
  return ObjectToString(joined.get(), {});
}

void ExtractHttpAttributes(PyObject* value, PythonError& error) {
  PyRef statusCode = PyRef::Steal(PyObject_GetAttrString(value, "status_code"));
  if (!statusCode) {
    PyErr_Clear();
    return;
  }
  if (!PyLong_Check(statusCode.get()) || PyBool_Check(statusCode.get())) {
    return;
  }
  const long status = PyLong_AsLong(statusCode.get());
  if (status == -1 && PyErr_Occurred() != nullptr) {
    PyErr_Clear();
    return;
  }
  if (status < 400 || status > http::kMaxStatusCode) {
    log::warn("Ignoring out of range status_code {} carried by {}", status, error.typeName);
    return;
  }
  error.statusCode = static_cast<http::StatusCode>(status);

  PyRef detail = PyRef::Steal(PyObject_GetAttrString(value, "detail"));
  if (!detail) {
    PyErr_Clear();
    return;
  }
  if (detail.get() == Py_None) {
    return;
  }
  if (PyUnicode_Check(detail.get())) {
    error.detail = ObjectToString(detail.get(), {});
    return;
  }
  const PythonModules* modules = PythonModules::IfLoaded();
  if (modules == nullptr) {
    return;
  }
  PyRef json = PyRef::Steal(PyObject_CallOneArg(modules->jsonDumps.get(), detail.get()));
  if (!json) {
    PyErr_Clear();
    error.detail = ObjectToString(detail.get(), {});
    return;
  }
  error.detailJson = ObjectToString(json.get(), {});
}

}  // namespace

std::string PythonError::summary() const {
  if (message.empty()) {
    return typeName;
  }
  return fmt::format("{}: {}", typeName, message);
}

PythonError FetchPythonError() {
  PyObject* type{};
  PyObject* value{};
  PyObject* traceback{};
  PyErr_Fetch(&type, &value, &traceback);
  if (type == nullptr) {
    return PythonError{"SystemError", "error return without exception set", {}, {}, {}, {}};
  }
  PyErr_NormalizeException(&type, &value, &traceback);
  if (traceback != nullptr && value != nullptr) {
    PyException_SetTraceback(value, traceback);
  }
  PyRef typeRef = PyRef::Steal(type);
  PyRef valueRef = PyRef::Steal(value);
  PyRef tracebackRef = PyRef::Steal(traceback);

  PythonError error;
  error.typeName = reinterpret_cast<PyTypeObject*>(type)->tp_name;
  if (valueRef) {
    error.message = ObjectToString(valueRef.get(), "<unprintable exception>");
    error.traceback = FormatTraceback(type, valueRef.get(), traceback);
    ExtractHttpAttributes(valueRef.get(), error);
  }
  return error;
}

PythonException::PythonException(PythonError error)
    : std::runtime_error(error.summary()), _error(std::move(error)) {}

void ThrowPythonError(std::string_view context) {
  PythonError error = FetchPythonError();
  error.message = fmt::format("{}: {}", context, error.message);
  throw PythonException(std::move(error));
}

}  // namespace turbo
