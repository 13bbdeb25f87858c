#pragma once

#include "turbo/python-include.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "turbo/http-method.hpp"
#include "turbo/py-ref.hpp"

namespace turbo {

enum class HandlerKind : uint8_t { Sync, Async };

// How a handler parameter is fed from the request.
enum class ParamKind : uint8_t {
  Any,       // no annotation: string value, int for an integer path segment
  Int,
  Float,
  Bool,
  Str,
  JsonBody,  // annotated 'dict': JSON decoded body
  RawBody,   // annotated 'bytes': body as is
  Request    // named 'request': request dictionary
};

[[nodiscard]] std::string_view ParamKindName(ParamKind kind) noexcept;

struct ParamSpecItem {
  std::string name;
  ParamKind kind{ParamKind::Any};
  // Default value, null when the parameter is required.
  PyRef defaultValue;

  [[nodiscard]] bool required() const noexcept { return !defaultValue; }
};

// Immutable description of a registered handler.
struct HandlerEntry {
  http::Method method{http::Method::GET};
  std::string pathPattern;
  std::string name;
  PyRef callable;
  HandlerKind kind{HandlerKind::Sync};
  std::vector<ParamSpecItem> params;

  [[nodiscard]] bool isAsync() const noexcept { return kind == HandlerKind::Async; }
};

}  // namespace turbo
