#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "turbo/http-method.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"

namespace turbo {

// Classification of every way a request can fail before or while producing a handler response.
enum class ErrorKind : uint8_t {
  RouteNotFound,
  MethodNotAllowed,
  HandlerException,
  ValidationError,
  TimedOut,
  BridgeUnavailable,
  RateLimited,
  BadRequest
};

[[nodiscard]] std::string_view ErrorKindName(ErrorKind kind) noexcept;

// Status used when the failure does not carry one of its own.
[[nodiscard]] http::StatusCode DefaultStatusCode(ErrorKind kind) noexcept;

struct Failure {
  ErrorKind kind{ErrorKind::HandlerException};
  http::StatusCode status{http::StatusCodeInternalServerError};
  std::string message;
  // Raw JSON value attached as "detail" to the body when not empty (e.g. validation errors).
  std::string detailJson;
};

// Result of the execution of one request: a handler response or a classified failure.
using Outcome = std::variant<HttpResponse, Failure>;

[[nodiscard]] inline Failure MakeFailure(ErrorKind kind, std::string message, std::string detailJson = {}) {
  return Failure{kind, DefaultStatusCode(kind), std::move(message), std::move(detailJson)};
}

// Builds the JSON error response body:
//   {"error": "<reason phrase>", "message": "...", "method": "GET", "path": "/x"[, "detail": ...]}
[[nodiscard]] HttpResponse MakeErrorResponse(const Failure& failure, http::Method method, std::string_view path);

// 405 response with the Allow header listing 'allowedMethods'.
[[nodiscard]] HttpResponse MakeMethodNotAllowedResponse(http::MethodBmp allowedMethods, http::Method method,
                                                        std::string_view path);

// 429 response with Retry-After.
[[nodiscard]] HttpResponse MakeRateLimitedResponse(uint32_t retryAfterSeconds);

// Minimal error answered by the transport layer for unparsable requests.
[[nodiscard]] HttpResponse MakeProtocolErrorResponse(http::StatusCode status);

}  // namespace turbo
