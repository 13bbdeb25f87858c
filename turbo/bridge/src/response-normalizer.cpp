#include "turbo/response-normalizer.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "turbo/execution-lock.hpp"
#include "turbo/http-constants.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"

namespace turbo {

namespace {

PythonError InvalidStatus(std::string message) {
  PythonError error;
  error.typeName = "ValueError";
  error.message = std::move(message);
  return error;
}

NormalizeResult NormalizeContent(PyObject* content, http::StatusCode status) {
  if (content == Py_None) {
    return HttpResponse(status);
  }
  if (PyUnicode_Check(content)) {
    Py_ssize_t size{};
    const char* data = PyUnicode_AsUTF8AndSize(content, &size);
    if (data == nullptr) {
      return FetchPythonError();
    }
    return HttpResponse(status, std::string(data, static_cast<std::size_t>(size)), http::ContentTypeTextPlain);
  }
  if (PyBytes_Check(content)) {
    return HttpResponse(status, std::string(PyBytes_AS_STRING(content), static_cast<std::size_t>(PyBytes_GET_SIZE(content))),
                        http::ContentTypeApplicationOctetStream);
  }
  if (PyByteArray_Check(content)) {
    return HttpResponse(status,
                        std::string(PyByteArray_AS_STRING(content), static_cast<std::size_t>(PyByteArray_GET_SIZE(content))),
                        http::ContentTypeApplicationOctetStream);
  }

  PyRef json = PyRef::Steal(PyObject_CallOneArg(PythonModules::Get().jsonDumps.get(), content));
  if (!json) {
    return FetchPythonError();
  }
  Py_ssize_t size{};
  const char* data = PyUnicode_AsUTF8AndSize(json.get(), &size);
  if (data == nullptr) {
    return FetchPythonError();
  }
  return HttpResponse(status, std::string(data, static_cast<std::size_t>(size)), http::ContentTypeApplicationJson);
}

}  // namespace

NormalizeResult NormalizeResponse(PyObject* value) {
  ExecutionLock lock;

  if (PyTuple_Check(value) && PyTuple_GET_SIZE(value) == 2) {
    PyObject* statusObj = PyTuple_GET_ITEM(value, 1);
    if (PyLong_Check(statusObj) && !PyBool_Check(statusObj)) {
      int overflow{};
      const long long status = PyLong_AsLongLongAndOverflow(statusObj, &overflow);
      if (status == -1 && PyErr_Occurred() != nullptr) {
        return FetchPythonError();
      }
      if (overflow != 0 || !http::IsValidStatusCode(status)) {
        return InvalidStatus(overflow != 0 ? std::string("Invalid status code: out of range")
                                           : fmt::format("Invalid status code {}", status));
      }
      return NormalizeContent(PyTuple_GET_ITEM(value, 0), static_cast<http::StatusCode>(status));
    }
  }
  return NormalizeContent(value, http::StatusCodeOK);
}

}  // namespace turbo
