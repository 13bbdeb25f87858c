#pragma once

#include <string_view>

namespace turbo::http {

// Header names in canonical form for emission. Parsing compares them case-insensitively.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view RetryAfter = "Retry-After";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view XForwardedFor = "X-Forwarded-For";
inline constexpr std::string_view XRealIp = "X-Real-IP";

inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

inline constexpr std::string_view HTTP11_100_CONTINUE = "HTTP/1.1 100 Continue\r\n\r\n";

}  // namespace turbo::http
