#include "turbo/http-error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "turbo/http-constants.hpp"
#include "turbo/http-method.hpp"
#include "turbo/http-response.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/json-escape.hpp"

namespace turbo {

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::RouteNotFound:
      return "RouteNotFound";
    case ErrorKind::MethodNotAllowed:
      return "MethodNotAllowed";
    case ErrorKind::HandlerException:
      return "HandlerException";
    case ErrorKind::ValidationError:
      return "ValidationError";
    case ErrorKind::TimedOut:
      return "TimedOut";
    case ErrorKind::BridgeUnavailable:
      return "BridgeUnavailable";
    case ErrorKind::RateLimited:
      return "RateLimited";
    case ErrorKind::BadRequest:
      return "BadRequest";
  }
  return "Unknown";
}

http::StatusCode DefaultStatusCode(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::RouteNotFound:
      return http::StatusCodeNotFound;
    case ErrorKind::MethodNotAllowed:
      return http::StatusCodeMethodNotAllowed;
    case ErrorKind::ValidationError:
      return http::StatusCodeUnprocessableEntity;
    case ErrorKind::TimedOut:
      return http::StatusCodeGatewayTimeout;
    case ErrorKind::BridgeUnavailable:
      return http::StatusCodeServiceUnavailable;
    case ErrorKind::RateLimited:
      return http::StatusCodeTooManyRequests;
    case ErrorKind::BadRequest:
      return http::StatusCodeBadRequest;
    case ErrorKind::HandlerException:
      [[fallthrough]];
    default:
      return http::StatusCodeInternalServerError;
  }
}

HttpResponse MakeErrorResponse(const Failure& failure, http::Method method, std::string_view path) {
  std::string body;
  body.reserve(64U + failure.message.size() + path.size() + failure.detailJson.size());
  std::string_view reason = http::ReasonPhrase(failure.status);
  if (reason.empty()) {
    reason = ErrorKindName(failure.kind);
  }
  body.append(R"({"error": )");
  AppendJsonString(body, reason);
  body.append(R"(, "message": )");
  AppendJsonString(body, failure.message);
  body.append(R"(, "method": )");
  AppendJsonString(body, http::MethodToStr(method));
  body.append(R"(, "path": )");
  AppendJsonString(body, path);
  if (!failure.detailJson.empty()) {
    body.append(R"(, "detail": )");
    body.append(failure.detailJson);
  }
  body.push_back('}');
  return {failure.status, std::move(body), http::ContentTypeApplicationJson};
}

HttpResponse MakeMethodNotAllowedResponse(http::MethodBmp allowedMethods, http::Method method, std::string_view path) {
  HttpResponse resp = MakeErrorResponse(
      MakeFailure(ErrorKind::MethodNotAllowed, fmt::format("Method {} not allowed", http::MethodToStr(method))), method,
      path);
  resp.header(http::Allow, http::MethodBmpToAllowValue(allowedMethods));
  return resp;
}

HttpResponse MakeRateLimitedResponse(uint32_t retryAfterSeconds) {
  HttpResponse resp(http::StatusCodeTooManyRequests,
                    fmt::format(R"({{"error": "RateLimitExceeded", "message": "Too many requests", "retry_after": {}}})",
                                retryAfterSeconds),
                    http::ContentTypeApplicationJson);
  resp.header(http::RetryAfter, fmt::format_int(retryAfterSeconds).str());
  return resp;
}

HttpResponse MakeProtocolErrorResponse(http::StatusCode status) {
  std::string body(R"({"error": )");
  AppendJsonString(body, http::ReasonPhrase(status));
  body.push_back('}');
  return {status, std::move(body), http::ContentTypeApplicationJson};
}

}  // namespace turbo
