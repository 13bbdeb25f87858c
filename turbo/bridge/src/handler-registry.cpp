#include "turbo/handler-registry.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "turbo/handler-entry.hpp"
#include "turbo/http-method.hpp"
#include "turbo/log.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"
#include "turbo/router.hpp"

namespace turbo {

namespace {

// Values of inspect.Parameter.kind
constexpr long kPositionalOnly = 0;
constexpr long kVarPositional = 2;
constexpr long kVarKeyword = 4;

std::string_view Utf8View(PyObject* str) {
  Py_ssize_t size{};
  const char* data = PyUnicode_AsUTF8AndSize(str, &size);
  if (data == nullptr) {
    ThrowPythonError("string conversion");
  }
  return {data, static_cast<std::size_t>(size)};
}

PyRef GetAttr(PyObject* obj, const char* name) {
  PyRef attr = PyRef::Steal(PyObject_GetAttrString(obj, name));
  if (!attr) {
    ThrowPythonError(name);
  }
  return attr;
}

std::string HandlerName(PyObject* callable) {
  for (const char* attrName : {"__qualname__", "__name__"}) {
    PyRef attr = PyRef::Steal(PyObject_GetAttrString(callable, attrName));
    if (attr && PyUnicode_Check(attr.get())) {
      return std::string(Utf8View(attr.get()));
    }
    PyErr_Clear();
  }
  return "<handler>";
}

ParamKind KindFromAnnotationName(std::string_view annotation) {
  if (annotation == "int") {
    return ParamKind::Int;
  }
  if (annotation == "float") {
    return ParamKind::Float;
  }
  if (annotation == "bool") {
    return ParamKind::Bool;
  }
  if (annotation == "str") {
    return ParamKind::Str;
  }
  if (annotation == "dict" || annotation.starts_with("dict[") || annotation.starts_with("Dict[")) {
    return ParamKind::JsonBody;
  }
  if (annotation == "bytes") {
    return ParamKind::RawBody;
  }
  return ParamKind::Any;
}

ParamKind KindFromAnnotation(std::string_view name, PyObject* annotation, PyObject* empty) {
  if (name == "request") {
    return ParamKind::Request;
  }
  if (annotation == empty) {
    return ParamKind::Any;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyLong_Type)) {
    return ParamKind::Int;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyFloat_Type)) {
    return ParamKind::Float;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyBool_Type)) {
    return ParamKind::Bool;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyUnicode_Type)) {
    return ParamKind::Str;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyDict_Type)) {
    return ParamKind::JsonBody;
  }
  if (annotation == reinterpret_cast<PyObject*>(&PyBytes_Type)) {
    return ParamKind::RawBody;
  }
  if (PyUnicode_Check(annotation)) {
    // postponed evaluation of annotations (from __future__ import annotations)
    return KindFromAnnotationName(Utf8View(annotation));
  }
  // generic aliases such as dict[str, int]
  PyRef origin = PyRef::Steal(PyObject_GetAttrString(annotation, "__origin__"));
  if (!origin) {
    PyErr_Clear();
  } else if (origin.get() == reinterpret_cast<PyObject*>(&PyDict_Type)) {
    return ParamKind::JsonBody;
  }
  log::debug("Unsupported annotation for parameter '{}', it will receive the raw string value", name);
  return ParamKind::Any;
}

void IntrospectParams(PyObject* callable, std::string_view description, std::vector<ParamSpecItem>& params) {
  const PythonModules& modules = PythonModules::Get();
  PyRef signature = PyRef::Steal(PyObject_CallOneArg(modules.signature.get(), callable));
  if (!signature) {
    ThrowPythonError("inspect.signature");
  }
  PyRef parameters = GetAttr(signature.get(), "parameters");
  PyRef values = PyRef::Steal(PyMapping_Values(parameters.get()));
  if (!values) {
    ThrowPythonError("inspect.signature");
  }
  const Py_ssize_t nbParams = PyList_GET_SIZE(values.get());
  for (Py_ssize_t paramPos = 0; paramPos < nbParams; ++paramPos) {
    PyObject* param = PyList_GET_ITEM(values.get(), paramPos);

    PyRef kindObj = GetAttr(param, "kind");
    const long kind = PyLong_AsLong(kindObj.get());
    if (kind == -1 && PyErr_Occurred() != nullptr) {
      ThrowPythonError("parameter kind");
    }
    if (kind == kVarPositional || kind == kVarKeyword) {
      continue;
    }

    PyRef nameObj = GetAttr(param, "name");
    ParamSpecItem item;
    item.name = Utf8View(nameObj.get());
    if (kind == kPositionalOnly) {
      throw std::invalid_argument(
          fmt::format("Handler {}: positional-only parameter '{}' cannot be bound", description, item.name));
    }

    PyRef annotation = GetAttr(param, "annotation");
    item.kind = KindFromAnnotation(item.name, annotation.get(), modules.parameterEmpty.get());

    PyRef defaultValue = GetAttr(param, "default");
    if (defaultValue.get() != modules.parameterEmpty.get()) {
      item.defaultValue = std::move(defaultValue);
    }
    params.push_back(std::move(item));
  }
}

}  // namespace

std::string_view ParamKindName(ParamKind kind) noexcept {
  switch (kind) {
    case ParamKind::Any:
      return "any";
    case ParamKind::Int:
      return "int";
    case ParamKind::Float:
      return "float";
    case ParamKind::Bool:
      return "bool";
    case ParamKind::Str:
      return "str";
    case ParamKind::JsonBody:
      return "dict";
    case ParamKind::RawBody:
      return "bytes";
    case ParamKind::Request:
      return "request";
  }
  return "unknown";
}

const HandlerEntry& HandlerRegistry::add(http::Method method, std::string_view pathPattern, PyObject* callable) {
  if (_frozen) {
    throw std::logic_error(
        fmt::format("Cannot register {} {}: the server is already running", http::MethodToStr(method), pathPattern));
  }
  if (callable == nullptr || PyCallable_Check(callable) == 0) {
    throw std::invalid_argument(
        fmt::format("Handler for {} {} is not callable", http::MethodToStr(method), pathPattern));
  }

  HandlerEntry entry;
  entry.method = method;
  entry.pathPattern.assign(pathPattern);
  entry.name = HandlerName(callable);
  entry.callable = PyRef::Borrow(callable);

  const PythonModules& modules = PythonModules::Get();
  PyRef isCoroutine = PyRef::Steal(PyObject_CallOneArg(modules.isCoroutineFunction.get(), callable));
  if (!isCoroutine) {
    ThrowPythonError("inspect.iscoroutinefunction");
  }
  const int isAsync = PyObject_IsTrue(isCoroutine.get());
  if (isAsync == -1) {
    ThrowPythonError("inspect.iscoroutinefunction");
  }
  entry.kind = isAsync == 1 ? HandlerKind::Async : HandlerKind::Sync;

  IntrospectParams(callable, entry.name, entry.params);

  const auto [routeId, inserted] = _router.add(method, pathPattern);
  if (!inserted) {
    const HandlerEntry& existing = _entries[routeId];
    log::warn("Route {} {} is already registered to {}, ignoring {}", http::MethodToStr(method), pathPattern,
              existing.name, entry.name);
    return existing;
  }

  log::debug("Registered {} {} -> {} ({}, {} parameter(s))", http::MethodToStr(method), pathPattern, entry.name,
             entry.isAsync() ? "async" : "sync", entry.params.size());
  if (entry.isAsync()) {
    ++_nbAsync;
  }
  _entries.push_back(std::move(entry));
  return _entries.back();
}

std::string HandlerRegistry::describe() const {
  std::string out;
  for (const HandlerEntry& entry : _entries) {
    out.append(fmt::format("{} {} -> {} ({})\n", http::MethodToStr(entry.method), entry.pathPattern, entry.name,
                           entry.isAsync() ? "async" : "sync"));
  }
  return out;
}

void HandlerRegistry::clear() {
  _entries.clear();
  _router = Router();
  _nbAsync = 0;
  _frozen = false;
}

}  // namespace turbo
