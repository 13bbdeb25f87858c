#pragma once

#include "turbo/python-include.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbo/http-status-code.hpp"

namespace turbo {

// Native snapshot of a Python exception, safe to carry across threads and without the execution lock.
struct PythonError {
  std::string typeName;
  std::string message;
  std::string traceback;
  // Set when the exception carries an integer 'status_code' attribute in [400, 599].
  std::optional<http::StatusCode> statusCode;
  // Message to expose to clients when the exception carries a 'detail' string.
  std::optional<std::string> detail;
  // JSON serialization of a non string 'detail' attribute.
  std::string detailJson;

  // "TypeName: message"
  [[nodiscard]] std::string summary() const;
};

// Fetches and clears the pending Python exception. Requires the execution lock.
// Returns a generic error if no exception is set.
[[nodiscard]] PythonError FetchPythonError();

class PythonException : public std::runtime_error {
 public:
  explicit PythonException(PythonError error);

  [[nodiscard]] const PythonError& error() const noexcept { return _error; }

 private:
  PythonError _error;
};

// Fetches the pending Python exception and throws it as a PythonException prefixed with 'context'.
// Requires the execution lock.
[[noreturn]] void ThrowPythonError(std::string_view context);

}  // namespace turbo
