#pragma once

#include "turbo/python-include.hpp"

#include <span>
#include <string>
#include <vector>

#include "turbo/handler-entry.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/request-context.hpp"

namespace turbo {

struct FieldError {
  // "path", "query" or "body"
  std::string source;
  // empty for whole body errors
  std::string name;
  std::string msg;
  std::string type;
};

struct BindResult {
  // Keyword arguments dict, null if 'errors' is not empty.
  PyRef kwargs;
  std::vector<FieldError> errors;

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

// Builds the keyword arguments of 'entry' from the request: path parameters first, then query parameters,
// then declared defaults. Requires the execution lock. Throws PythonException on unexpected interpreter errors.
[[nodiscard]] BindResult BindArguments(const HandlerEntry& entry, const RequestContext& ctx);

// Dictionary {method, path, headers, query, path_params, body, client} handed to 'request' parameters.
// Requires the execution lock.
[[nodiscard]] PyRef MakeRequestDict(const RequestContext& ctx);

// JSON array of {"loc": [source, name], "msg": ..., "type": ...} objects.
[[nodiscard]] std::string FieldErrorsToJson(std::span<const FieldError> errors);

}  // namespace turbo
