#include "turbo/http-response.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "turbo/http-constants.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/simple-charconv.hpp"
#include "turbo/string-equal-ignore-case.hpp"
#include "turbo/timedef.hpp"
#include "turbo/timestring.hpp"

namespace turbo {

namespace {

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

}  // namespace

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  if (CaseInsensitiveEqual(name, http::ContentType) && !_contentType.empty()) {
    return std::string_view(_contentType);
  }
  for (const auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(headerValue);
    }
  }
  return std::nullopt;
}

void AppendResponseWire(std::string& out, const HttpResponse& response, const ResponseWireOptions& options) {
  const http::StatusCode status = response.status();
  const bool bodyless = http::IsBodylessStatusCode(status);

  // Status line: HTTP/1.1 404 Not Found\r\n
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  const auto statusPos = out.size();
  out.resize(statusPos + 3U);
  write3(out.data() + statusPos, status);
  const std::string_view reason = http::ReasonPhrase(status);
  if (!reason.empty()) {
    out.push_back(' ');
    out.append(reason);
  }
  out.append(http::CRLF);

  if (options.addDate) {
    out.append(http::Date);
    out.append(http::HeaderSep);
    const auto datePos = out.size();
    out.resize(datePos + kRFC7231DateStrLen);
    TimeToStringRFC7231(SysClock::now(), out.data() + datePos);
    out.append(http::CRLF);
  }

  if (!bodyless) {
    if (!response.contentType().empty()) {
      AppendHeader(out, http::ContentType, response.contentType());
    }
    AppendHeader(out, http::ContentLength, fmt::format_int(response.body().size()).str());
  }

  AppendHeader(out, http::Connection, options.keepAlive ? http::keepalive : http::close);

  for (const auto& [name, value] : response.headers()) {
    AppendHeader(out, name, value);
  }
  for (const auto& [name, value] : options.globalHeaders) {
    AppendHeader(out, name, value);
  }

  out.append(http::CRLF);

  if (!bodyless && !options.headRequest) {
    out.append(response.body());
  }
}

}  // namespace turbo
