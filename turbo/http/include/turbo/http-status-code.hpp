#pragma once

#include <cstdint>
#include <string_view>

namespace turbo::http {

using StatusCode = uint16_t;

inline constexpr StatusCode StatusCodeContinue = 100;
inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeUnprocessableEntity = 422;
inline constexpr StatusCode StatusCodeTooManyRequests = 429;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;
inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeGatewayTimeout = 504;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

inline constexpr StatusCode kMinStatusCode = 100;
inline constexpr StatusCode kMaxStatusCode = 599;

constexpr bool IsValidStatusCode(long long status) noexcept {
  return status >= kMinStatusCode && status <= kMaxStatusCode;
}

// Responses with these status codes never carry a body.
constexpr bool IsBodylessStatusCode(StatusCode status) noexcept {
  return status < StatusCodeOK || status == StatusCodeNoContent || status == StatusCodeNotModified;
}

// Standard reason phrase, or an empty string for unregistered codes.
std::string_view ReasonPhrase(StatusCode status) noexcept;

}  // namespace turbo::http
