#include "turbo/param-binder.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "turbo/handler-entry.hpp"
#include "turbo/json-escape.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-modules.hpp"
#include "turbo/request-context.hpp"
#include "turbo/string-equal-ignore-case.hpp"
#include "turbo/url-decode.hpp"

namespace turbo {

namespace {

constexpr std::string_view kSourcePath = "path";
constexpr std::string_view kSourceQuery = "query";
constexpr std::string_view kSourceBody = "body";

PyRef NewString(std::string_view value) {
  PyRef str = PyRef::Steal(PyUnicode_DecodeUTF8(value.data(), static_cast<Py_ssize_t>(value.size()), "replace"));
  if (!str) {
    ThrowPythonError("string conversion");
  }
  return str;
}

PyRef NewBytes(std::string_view value) {
  PyRef bytes = PyRef::Steal(PyBytes_FromStringAndSize(value.data(), static_cast<Py_ssize_t>(value.size())));
  if (!bytes) {
    ThrowPythonError("bytes conversion");
  }
  return bytes;
}

void SetItem(PyObject* dict, std::string_view key, const PyRef& value) {
  PyRef keyObj = NewString(key);
  if (PyDict_SetItem(dict, keyObj.get(), value.get()) != 0) {
    ThrowPythonError("dict insertion");
  }
}

// Dict of string pairs, first occurrence wins for repeated keys.
template <bool CaseInsensitiveKeys>
PyRef NewStringDict(std::span<const RequestContext::Field> fields) {
  PyRef dict = PyRef::Steal(PyDict_New());
  if (!dict) {
    ThrowPythonError("dict creation");
  }
  for (const auto& [key, value] : fields) {
    std::string keyStr = key;
    if constexpr (CaseInsensitiveKeys) {
      for (char& ch : keyStr) {
        ch = turbo::tolower(ch);
      }
    }
    PyRef keyObj = NewString(keyStr);
    const int contains = PyDict_Contains(dict.get(), keyObj.get());
    if (contains == -1) {
      ThrowPythonError("dict lookup");
    }
    if (contains == 0 && PyDict_SetItem(dict.get(), keyObj.get(), NewString(value).get()) != 0) {
      ThrowPythonError("dict insertion");
    }
  }
  return dict;
}

std::optional<bool> ParseBool(std::string_view value) {
  for (std::string_view token : {"true", "1", "yes", "on"}) {
    if (CaseInsensitiveEqual(value, token)) {
      return true;
    }
  }
  for (std::string_view token : {"false", "0", "no", "off"}) {
    if (CaseInsensitiveEqual(value, token)) {
      return false;
    }
  }
  return std::nullopt;
}

// Optional '-' then digits, without leading zero ("0" itself excepted) nor "-0".
bool IsCanonicalInteger(std::string_view value) {
  std::string_view digits = value;
  if (digits.starts_with('-')) {
    digits.remove_prefix(1);
  }
  if (digits.empty() || (digits.front() == '0' && (digits.size() > 1U || digits.size() != value.size()))) {
    return false;
  }
  return std::ranges::all_of(digits, [](char ch) { return ch >= '0' && ch <= '9'; });
}

// Converts a textual value according to 'item.kind'. Returns a null reference and fills 'error' on failure.
PyRef Coerce(const ParamSpecItem& item, std::string_view value, FieldError& error) {
  switch (item.kind) {
    case ParamKind::Int: {
      std::string_view digits = value;
      if (digits.starts_with('+')) {
        digits.remove_prefix(1);
      }
      long long parsed{};
      const auto [ptr, errc] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
      if (errc != std::errc() || ptr != digits.data() + digits.size() || digits.empty()) {
        error.msg = "Input should be a valid integer, unable to parse string as an integer";
        error.type = "int_parsing";
        return {};
      }
      PyRef obj = PyRef::Steal(PyLong_FromLongLong(parsed));
      if (!obj) {
        ThrowPythonError("int conversion");
      }
      return obj;
    }
    case ParamKind::Float: {
      double parsed{};
      const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (errc != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        error.msg = "Input should be a valid number, unable to parse string as a number";
        error.type = "float_parsing";
        return {};
      }
      PyRef obj = PyRef::Steal(PyFloat_FromDouble(parsed));
      if (!obj) {
        ThrowPythonError("float conversion");
      }
      return obj;
    }
    case ParamKind::Bool: {
      const auto parsed = ParseBool(value);
      if (!parsed) {
        error.msg = "Input should be a valid boolean, unable to interpret input";
        error.type = "bool_parsing";
        return {};
      }
      return PyRef::Borrow(*parsed ? Py_True : Py_False);
    }
    default:
      if (error.source == kSourcePath && IsCanonicalInteger(value)) {
        // unannotated path segments holding an integer are passed as int
        const std::string digits(value);
        PyRef obj = PyRef::Steal(PyLong_FromString(digits.c_str(), nullptr, 10));
        if (!obj) {
          ThrowPythonError("int conversion");
        }
        return obj;
      }
      return NewString(value);
  }
}

PyRef BindBody(const ParamSpecItem& item, const RequestContext& ctx, std::vector<FieldError>& errors) {
  if (item.kind == ParamKind::RawBody) {
    return NewBytes(ctx.body());
  }
  // JsonBody
  if (ctx.body().empty()) {
    if (!item.required()) {
      return item.defaultValue.dup();
    }
    errors.push_back({std::string(kSourceBody), item.name, "Field required", "missing"});
    return {};
  }
  PyRef bytes = NewBytes(ctx.body());
  PyRef decoded = PyRef::Steal(PyObject_CallOneArg(PythonModules::Get().jsonLoads.get(), bytes.get()));
  if (!decoded) {
    const PythonError error = FetchPythonError();
    errors.push_back({std::string(kSourceBody), {}, "JSON decode error: " + error.message, "json_invalid"});
    return {};
  }
  if (PyDict_Check(decoded.get()) == 0) {
    errors.push_back({std::string(kSourceBody), item.name, "Input should be a valid dictionary", "dict_type"});
    return {};
  }
  return decoded;
}

}  // namespace

PyRef MakeRequestDict(const RequestContext& ctx) {
  PyRef dict = PyRef::Steal(PyDict_New());
  if (!dict) {
    ThrowPythonError("dict creation");
  }
  SetItem(dict.get(), "method", NewString(http::MethodToStr(ctx.method())));
  SetItem(dict.get(), "path", NewString(ctx.path()));
  SetItem(dict.get(), "headers", NewStringDict<true>(ctx.headers()));
  SetItem(dict.get(), "query", NewStringDict<false>(ctx.queryParams()));
  SetItem(dict.get(), "path_params", NewStringDict<false>(ctx.pathParams()));
  SetItem(dict.get(), "body", NewBytes(ctx.body()));
  SetItem(dict.get(), "client", NewString(ctx.peerAddress()));
  return dict;
}

BindResult BindArguments(const HandlerEntry& entry, const RequestContext& ctx) {
  BindResult result;
  PyRef kwargs = PyRef::Steal(PyDict_New());
  if (!kwargs) {
    ThrowPythonError("dict creation");
  }

  std::string decoded;
  for (const ParamSpecItem& item : entry.params) {
    PyRef value;
    switch (item.kind) {
      case ParamKind::Request:
        value = MakeRequestDict(ctx);
        break;
      case ParamKind::JsonBody:
        [[fallthrough]];
      case ParamKind::RawBody:
        value = BindBody(item, ctx, result.errors);
        if (!value) {
          continue;
        }
        break;
      default: {
        FieldError error;
        std::optional<std::string_view> raw = ctx.pathParamValue(item.name);
        if (raw) {
          error.source = kSourcePath;
          if (!url::DecodePathSegment(*raw, decoded)) {
            result.errors.push_back({std::string(kSourcePath), item.name, "Invalid percent-encoding", "value_error"});
            continue;
          }
          raw = decoded;
        } else {
          error.source = kSourceQuery;
          raw = ctx.queryParamValue(item.name);
        }
        if (!raw) {
          if (item.required()) {
            result.errors.push_back({std::string(kSourceQuery), item.name, "Field required", "missing"});
            continue;
          }
          value = item.defaultValue.dup();
          break;
        }
        value = Coerce(item, *raw, error);
        if (!value) {
          error.name = item.name;
          result.errors.push_back(std::move(error));
          continue;
        }
        break;
      }
    }
    SetItem(kwargs.get(), item.name, value);
  }

  if (result.errors.empty()) {
    result.kwargs = std::move(kwargs);
  }
  return result;
}

std::string FieldErrorsToJson(std::span<const FieldError> errors) {
  std::string out("[");
  for (const FieldError& error : errors) {
    if (out.size() > 1U) {
      out.append(", ");
    }
    out.append(R"({"loc": [)");
    AppendJsonString(out, error.source);
    if (!error.name.empty()) {
      out.append(", ");
      AppendJsonString(out, error.name);
    }
    out.append(R"(], "msg": )");
    AppendJsonString(out, error.msg);
    out.append(R"(, "type": )");
    AppendJsonString(out, error.type);
    out.push_back('}');
  }
  out.push_back(']');
  return out;
}

}  // namespace turbo
