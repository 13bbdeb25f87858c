#pragma once

#include "turbo/python-include.hpp"

#include <variant>

#include "turbo/http-response.hpp"
#include "turbo/python-error.hpp"

namespace turbo {

using NormalizeResult = std::variant<HttpResponse, PythonError>;

// Maps a handler return value to a response:
//  - (content, status) 2-tuple with a non bool int status in [100, 599]: content normalized as below
//  - None: empty body
//  - str: text/plain, bytes / bytearray: application/octet-stream
//  - anything else: json.dumps output as application/json
// Takes the execution lock (re-entrant). Never leaves a Python exception pending.
[[nodiscard]] NormalizeResult NormalizeResponse(PyObject* value);

}  // namespace turbo
